#pragma once

#include <optional>
#include <string>

namespace resplit {

// Remote collaborator of the sync engine. Connection and auth setup happen
// before the engine sees the store. Calls for distinct object names may
// arrive from several threads at once.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Throws RemoteUnavailable if the store cannot be used at all
    virtual void check_available() = 0;

    // Name of the digest the store computes natively ("sha1")
    virtual std::string digest_algorithm() const = 0;

    // Lowercase hex digest of the named object, no value if it does not exist.
    // Throws RemoteError if the store could not be queried.
    virtual std::optional<std::string> fetch_digest(const std::string& name) = 0;

    // Throws RemoteError on failure
    virtual void upload(const std::string& local_path, const std::string& name) = 0;
};

} // namespace resplit
