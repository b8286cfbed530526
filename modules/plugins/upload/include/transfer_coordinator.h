// Boundary to the remote storage coordinator (create/accept/complete multipart uploads).
// Concrete implementations must honor this API so the pipeline stays decoupled
// from the transport.
#ifndef TRANSFER_COORDINATOR_H
#define TRANSFER_COORDINATOR_H

#include "upload_types.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

enum class CoordinatorOutcome {
    OK,
    NETWORK_ERROR,      // request never reached the service (refused, DNS, reset before send)
    CONNECTION_LOST,    // connection aborted / empty response mid-request
    SERVER_ERROR,       // service answered with a 5xx status
    REJECTED,           // service answered with a 4xx status
    INVALID_RESPONSE,   // answer could not be parsed
    ABORTED             // caller's abort callback fired
};

struct CoordinatorResult {
    CoordinatorOutcome outcome = CoordinatorOutcome::OK;
    int status = 200;
    std::string etag;       // uploadPart only
    std::string message;

    bool ok() const { return outcome == CoordinatorOutcome::OK; }
};

struct RemoteUpload {
    std::string upload_id;
    std::string remote_key;
};

struct TransferValidation {
    bool valid = false;
    std::string reason;     // set when !valid
};

class TransferCoordinator {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using AbortCB = std::function<bool()>;

    virtual ~TransferCoordinator() = default;

    virtual CoordinatorResult create_upload(const std::string& file_id,
                                            const std::string& filename,
                                            uint64_t size,
                                            RemoteUpload& out) = 0;

    // One attempt. Implementations poll should_abort while sending and
    // return ABORTED as soon as it reports true.
    virtual CoordinatorResult upload_part(const std::string& remote_key,
                                          const std::string& upload_id,
                                          uint32_t part_number,
                                          const std::vector<uint8_t>& bytes,
                                          ProgressCB progress = {},
                                          AbortCB should_abort = {}) = 0;

    // parts must be sorted ascending by part_number
    virtual CoordinatorResult complete_upload(const std::string& remote_key,
                                              const std::string& upload_id,
                                              const std::vector<CompletedPart>& parts) = 0;

    virtual CoordinatorResult put_whole(const std::string& remote_key,
                                        const std::vector<uint8_t>& bytes,
                                        ProgressCB progress = {},
                                        AbortCB should_abort = {}) = 0;

    virtual TransferValidation validate_still_open(const std::string& transfer_id) = 0;
};

#endif // TRANSFER_COORDINATOR_H
