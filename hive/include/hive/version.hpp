#pragma once

#define HIVE_VERSION "0.4.0"
#define HIVE_SNAPSHOT_VERSION_MAJOR 1
#define HIVE_SNAPSHOT_VERSION_MINOR 1
#define HIVE_QUOTA_FILE_VERSION 1

namespace hive {
namespace version {

inline bool snapshot_compatible(int major, int minor) {
    // Major version must match exactly (breaking changes)
    // Minor version: reader must be >= writer (additive fields only)
    return major == HIVE_SNAPSHOT_VERSION_MAJOR &&
           minor <= HIVE_SNAPSHOT_VERSION_MINOR;
}

} // namespace version
} // namespace hive
