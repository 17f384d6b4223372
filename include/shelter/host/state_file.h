#pragma once
#include <shelter/worker/lifecycle.h>
#include <shelter/worker/service_worker.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace shelter::host {

class StateFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything the host keeps between runs
struct PersistedState {
    worker::WorkerState state = worker::WorkerState::Parsed;
    std::string cache_name;
    std::vector<uint8_t> caches;
    std::vector<uint8_t> sync_queue;
};

std::vector<uint8_t> encode_state(const PersistedState& state);
// Throws StateFileError
PersistedState decode_state(const std::vector<uint8_t>& data);

PersistedState capture_state(worker::ServiceWorker& worker);

// Load into `worker`. A state saved under another cache name restores its
// caches and queue but the worker starts over from Parsed.
void apply_state(const PersistedState& state, worker::ServiceWorker& worker);

// Writes via a temporary file and rename. Throws StateFileError.
void save_state_file(const std::string& path, const PersistedState& state);

// False when the file does not exist. Throws StateFileError when it is
// unreadable or corrupt.
bool load_state_file(const std::string& path, PersistedState& out);

} // namespace shelter::host
