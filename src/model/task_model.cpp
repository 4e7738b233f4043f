#include "zmake/task_model.hpp"

namespace zmake {

const PlatformSteps* SectionSpec::for_os(OsTarget os) const {
    switch (os) {
        case OsTarget::Windows: return on_windows ? &*on_windows : nullptr;
        case OsTarget::Linux: return on_linux ? &*on_linux : nullptr;
        case OsTarget::MacOS: return on_macos ? &*on_macos : nullptr;
        default: return nullptr;
    }
}

PlatformSteps* SectionSpec::for_os(OsTarget os) {
    switch (os) {
        case OsTarget::Windows: return on_windows ? &*on_windows : nullptr;
        case OsTarget::Linux: return on_linux ? &*on_linux : nullptr;
        case OsTarget::MacOS: return on_macos ? &*on_macos : nullptr;
        default: return nullptr;
    }
}

bool is_reserved_block_name(const std::string& name) {
    if (parse_section(name).has_value()) {
        return true;
    }
    return parse_os_target(name).has_value();
}

} // namespace zmake
