#include "upload/model/FilePart.hpp"

using namespace cw::upload::model;

std::string_view FilePart::toString(const Status s) noexcept {
    switch (s) {
        case Status::PENDING: return "pending";
        case Status::IN_PROGRESS: return "in-progress";
        case Status::COMPLETED: return "completed";
        case Status::FAILED: return "failed";
        case Status::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}
