#include "vscore/types.hpp"

namespace vscore {

std::string version_tag(Version version) {
    return "CVSS:" + version_name(version);
}

std::string version_name(Version version) {
    switch (version) {
        case Version::kV3_1:
            return "3.1";
        case Version::kV4_0:
            return "4.0";
    }
    return "3.1";
}

}  // namespace vscore
