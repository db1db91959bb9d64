#include "shikenmatrix.h"
#include "Runtime.hpp"
#include <exception>

extern "C" {

bool sm_check_accessibility_permission(void) {
    try {
        auto gate = ffi::registry().permission_gate();
        return gate && gate->check_accessibility();
    } catch (const std::exception& e) {
        ffi::report_failure("sm_check_accessibility_permission", e.what());
        return false;
    }
}

bool sm_request_accessibility_permission(void) {
    try {
        auto gate = ffi::registry().permission_gate();
        return gate && gate->request_accessibility();
    } catch (const std::exception& e) {
        ffi::report_failure("sm_request_accessibility_permission", e.what());
        return false;
    }
}

bool sm_check_media_permission(void) {
    try {
        auto gate = ffi::registry().permission_gate();
        return gate && gate->check_media();
    } catch (const std::exception& e) {
        ffi::report_failure("sm_check_media_permission", e.what());
        return false;
    }
}

void sm_reset_media_permission_check(void) {
    try {
        auto gate = ffi::registry().permission_gate();
        if (gate) gate->reset_media_check();
    } catch (const std::exception& e) {
        ffi::report_failure("sm_reset_media_permission_check", e.what());
    }
}

} // extern "C"
