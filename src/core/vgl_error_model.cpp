#include "vgl/core/vgl_error_model.h"

namespace {

struct CodeRange {
    vgl_result_t first;  // least negative code of the range
    vgl_result_t last;
    const char* category;
    bool retryable;
};

// Keep in step with the groups in vgl_error.h
constexpr CodeRange kRanges[] = {
    {-100, -109, "Initialization", false},
    {-110, -129, "Model", true},
    {-130, -149, "Inference", true},
    {-250, -279, "Validation", false},
    {-280, -299, "Audio", false},
    {-380, -399, "Protocol", false},
    {-400, -499, "EngineProvider", false},
    {-600, -699, "Engine", true},
    {-700, -799, "Channel", false},
    {-800, -899, "Other", false},
};

const CodeRange* find_range(vgl_result_t code) {
    for (const CodeRange& range : kRanges) {
        if (code <= range.first && code >= range.last) {
            return &range;
        }
    }
    return nullptr;
}

}  // namespace

extern "C" {

const char* vgl_error_category(vgl_result_t code) {
    if (code == VGL_SUCCESS) {
        return "Success";
    }
    const CodeRange* range = find_range(code);
    return range != nullptr ? range->category : "Unknown";
}

vgl_bool_t vgl_error_is_retryable(vgl_result_t code) {
    const CodeRange* range = find_range(code);
    return range != nullptr && range->retryable ? VGL_TRUE : VGL_FALSE;
}

vgl_error_model_t vgl_make_error_model(vgl_result_t code) {
    vgl_error_model_t model;
    model.code = code;
    model.message = vgl_error_message(code);
    model.category = vgl_error_category(code);
    model.retryable = vgl_error_is_retryable(code);
    return model;
}

}  // extern "C"
