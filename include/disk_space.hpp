#pragma once

#include <cstdint>
#include <string>

namespace resplit {

const uint64_t GIB = 1024ULL * 1024 * 1024;

// Reports free bytes on the filesystem holding `path`
class SpaceProbe {
public:
    virtual ~SpaceProbe() = default;
    virtual uint64_t available_bytes(const std::string& path) = 0;
};

class FilesystemSpaceProbe : public SpaceProbe {
public:
    // Throws IoError if the filesystem cannot be queried
    uint64_t available_bytes(const std::string& path) override;
};

struct SpaceCheck {
    bool admitted;
    uint64_t available;
    uint64_t required;
};

// Admits a new chunk only while chunk_size + safety_buffer bytes are free.
// The counter is read without locking, so the buffer is a margin, not a reservation.
class DiskSpaceGovernor {
public:
    DiskSpaceGovernor(SpaceProbe& probe, const std::string& output_dir, uint64_t chunk_size,
                      uint64_t safety_buffer);

    SpaceCheck check();
    uint64_t available();
    uint64_t required() const { return required_; }

private:
    SpaceProbe& probe_;
    std::string output_dir_;
    uint64_t required_;
};

} // namespace resplit
