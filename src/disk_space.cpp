#include "disk_space.hpp"
#include "errors.hpp"
#include <filesystem>
#include <limits>
#include <system_error>

namespace resplit {

uint64_t FilesystemSpaceProbe::available_bytes(const std::string& path) {
    std::error_code ec;
    std::filesystem::space_info info = std::filesystem::space(path, ec);
    if (ec) {
        throw IoError("Could not query free space of " + path + ": " + ec.message());
    }
    return info.available;
}

DiskSpaceGovernor::DiskSpaceGovernor(SpaceProbe& probe, const std::string& output_dir,
                                     uint64_t chunk_size, uint64_t safety_buffer)
    : probe_(probe), output_dir_(output_dir), required_(chunk_size + safety_buffer) {
    if (required_ < chunk_size) {
        required_ = std::numeric_limits<uint64_t>::max();
    }
}

uint64_t DiskSpaceGovernor::available() {
    return probe_.available_bytes(output_dir_);
}

SpaceCheck DiskSpaceGovernor::check() {
    uint64_t free_bytes = available();
    return SpaceCheck{free_bytes >= required_, free_bytes, required_};
}

} // namespace resplit
