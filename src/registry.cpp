// src/registry.cpp
// Implementation of the stage registry

#include "stagewise/registry.hpp"

namespace stagewise {

namespace {

template<typename List>
std::vector<std::string> collect_names(const List& list) {
    std::vector<std::string> names;
    names.reserve(list.size());
    for (const auto& middleware : list) {
        names.push_back(middleware->get_name());
    }
    return names;
}

template<typename List>
void visit_all(Stage stage, const List& list,
               const std::function<void(Stage, MiddlewareBase&)>& visitor) {
    for (const auto& middleware : list) {
        visitor(stage, *middleware);
    }
}

} // namespace

void StageRegistry::register_middleware(Stage stage, const Middleware& middleware) {
    if (is_null(middleware)) {
        throw Errors::null_middleware(stage);
    }

    StageFamily actual = middleware_family(middleware);
    if (actual != Utils::stage_family(stage)) {
        throw Errors::stage_mismatch(stage, middleware_name(middleware), actual);
    }

    switch (stage) {
        case Stage::PRE_PROCESSING:
            pre_processing_.push_back(std::get<std::shared_ptr<TransformMiddleware>>(middleware));
            break;
        case Stage::REQUEST_HANDLING:
            interceptors_.push_back(std::get<std::shared_ptr<Interceptor>>(middleware));
            break;
        case Stage::POST_PROCESSING:
            post_processing_.push_back(std::get<std::shared_ptr<TransformMiddleware>>(middleware));
            break;
        case Stage::ERROR_HANDLING:
            error_handlers_.push_back(std::get<std::shared_ptr<ErrorHandler>>(middleware));
            break;
        case Stage::CLEANUP:
            cleanup_handlers_.push_back(std::get<std::shared_ptr<CleanupHandler>>(middleware));
            break;
    }
}

const StageRegistry::Transforms& StageRegistry::transforms(Stage stage) const {
    if (stage == Stage::POST_PROCESSING) {
        return post_processing_;
    }
    if (stage != Stage::PRE_PROCESSING) {
        throw std::invalid_argument("Stage '" + Utils::stage_to_string(stage) +
                                    "' does not hold transforms");
    }
    return pre_processing_;
}

size_t StageRegistry::count(Stage stage) const {
    switch (stage) {
        case Stage::PRE_PROCESSING: return pre_processing_.size();
        case Stage::REQUEST_HANDLING: return interceptors_.size();
        case Stage::POST_PROCESSING: return post_processing_.size();
        case Stage::ERROR_HANDLING: return error_handlers_.size();
        case Stage::CLEANUP: return cleanup_handlers_.size();
        default: return 0;
    }
}

std::array<size_t, STAGE_COUNT> StageRegistry::counts() const {
    std::array<size_t, STAGE_COUNT> result{};
    for (Stage stage : ALL_STAGES) {
        result[static_cast<size_t>(stage)] = count(stage);
    }
    return result;
}

std::vector<std::string> StageRegistry::names(Stage stage) const {
    switch (stage) {
        case Stage::PRE_PROCESSING: return collect_names(pre_processing_);
        case Stage::REQUEST_HANDLING: return collect_names(interceptors_);
        case Stage::POST_PROCESSING: return collect_names(post_processing_);
        case Stage::ERROR_HANDLING: return collect_names(error_handlers_);
        case Stage::CLEANUP: return collect_names(cleanup_handlers_);
        default: return {};
    }
}

size_t StageRegistry::total() const {
    size_t sum = 0;
    for (size_t n : counts()) {
        sum += n;
    }
    return sum;
}

void StageRegistry::for_each(const std::function<void(Stage, MiddlewareBase&)>& visitor) const {
    visit_all(Stage::PRE_PROCESSING, pre_processing_, visitor);
    visit_all(Stage::REQUEST_HANDLING, interceptors_, visitor);
    visit_all(Stage::POST_PROCESSING, post_processing_, visitor);
    visit_all(Stage::ERROR_HANDLING, error_handlers_, visitor);
    visit_all(Stage::CLEANUP, cleanup_handlers_, visitor);
}

} // namespace stagewise
