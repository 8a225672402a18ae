#include "justdl/result.hpp"

namespace justdl {

std::string_view toString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Success: return "success";
        case Outcome::Failure: return "failure";
        case Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace justdl
