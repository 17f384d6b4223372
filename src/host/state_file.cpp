#include <shelter/host/state_file.h>
#include <shelter/ipc/serializer.h>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace shelter::host {

namespace {
constexpr uint32_t kStateMagic = 0x53485354;  // "SHST"
constexpr uint16_t kStateVersion = 1;
} // namespace

std::vector<uint8_t> encode_state(const PersistedState& state) {
    ipc::Serializer s;
    s.write_u32(kStateMagic);
    s.write_u16(kStateVersion);
    s.write_string(worker::worker_state_name(state.state));
    s.write_string(state.cache_name);
    s.write_bytes(state.caches);
    s.write_bytes(state.sync_queue);
    return s.take_data();
}

PersistedState decode_state(const std::vector<uint8_t>& data) {
    PersistedState state;
    try {
        ipc::Deserializer d(data);
        if (d.read_u32() != kStateMagic) {
            throw StateFileError("not a shelter state file");
        }
        uint16_t version = d.read_u16();
        if (version != kStateVersion) {
            throw StateFileError("unsupported state file version " + std::to_string(version));
        }
        std::string name = d.read_string();
        auto parsed = worker::worker_state_from_name(name);
        if (!parsed) {
            throw StateFileError("unknown worker state '" + name + "'");
        }
        state.state = *parsed;
        state.cache_name = d.read_string();
        state.caches = d.read_bytes();
        state.sync_queue = d.read_bytes();
    } catch (const ipc::DeserializeError& e) {
        throw StateFileError(std::string("state file truncated: ") + e.what());
    }
    return state;
}

PersistedState capture_state(worker::ServiceWorker& worker) {
    PersistedState state;
    state.state = worker.state();
    state.cache_name = worker.cache_name();
    state.caches = worker.cache_storage().serialize();
    state.sync_queue = worker.sync_queue().serialize();
    return state;
}

void apply_state(const PersistedState& state, worker::ServiceWorker& worker) {
    try {
        if (!state.caches.empty()) {
            worker.cache_storage().deserialize(state.caches);
        }
        if (!state.sync_queue.empty()) {
            worker.sync_queue().deserialize(state.sync_queue);
        }
    } catch (const std::runtime_error& e) {
        throw StateFileError(std::string("cannot restore state: ") + e.what());
    }

    if (state.cache_name == worker.cache_name()) {
        worker.restore(state.state);
    } else {
        worker.restore(worker::WorkerState::Parsed);
    }
}

void save_state_file(const std::string& path, const PersistedState& state) {
    auto bytes = encode_state(state);
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StateFileError("cannot open " + tmp + " for writing");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw StateFileError("write to " + tmp + " failed");
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw StateFileError("cannot replace " + path);
    }
}

bool load_state_file(const std::string& path, PersistedState& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StateFileError("cannot open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    out = decode_state(bytes);
    return true;
}

} // namespace shelter::host
