// ============================================================================
// rivulet/core/error.cpp - Error Category Implementation
// ============================================================================

#include "rivulet/core/error.hpp"

#include <string>

namespace rivulet {

namespace {

class RivuletCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "rivulet"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::StepFailed:
                return "State-action step failed";
            case Errc::NoSuchElement:
                return "Stream completed without elements";
            case Errc::BrokenPromise:
                return "Promise destroyed before completion";
            default:
                return "Unknown rivulet error";
        }
    }
};

}  // namespace

const std::error_category& RivuletCategory() noexcept {
    static const RivuletCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), RivuletCategory()};
}

}  // namespace rivulet
