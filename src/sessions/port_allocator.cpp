#include "sessions/port_allocator.h"
#include "sessions/session_store.h"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace kild {

namespace {

constexpr uint32_t MAX_PORT_END = 65536;

}

Result<PortRange> find_next_available_range(const std::vector<PortRange>& occupied,
                                            uint16_t count, uint16_t base_port) {
    if (count == 0) {
        return make_error(ErrorKind::InvalidInput, "port range size must be greater than zero");
    }

    std::vector<PortRange> sorted = occupied;
    std::sort(sorted.begin(), sorted.end(), [](const PortRange& a, const PortRange& b) {
        return a.base < b.base;
    });

    uint32_t candidate = base_port;
    for (const auto& range : sorted) {
        if (range.count == 0 || range.end() <= candidate) {
            continue;
        }
        if (candidate + count <= range.base) {
            break;
        }
        candidate = std::max<uint32_t>(candidate, range.end());
    }

    if (candidate + count > MAX_PORT_END) {
        return make_error(ErrorKind::PortAllocationExhausted,
            "no free range of " + std::to_string(count) + " ports at or above " + std::to_string(base_port));
    }

    PortRange result;
    result.base = static_cast<uint16_t>(candidate);
    result.count = count;
    return result;
}

bool is_range_available(const std::vector<Session>& sessions, const PortRange& candidate) {
    return std::none_of(sessions.begin(), sessions.end(), [&candidate](const Session& s) {
        return s.port_range.count > 0 && s.port_range.overlaps(candidate);
    });
}

std::vector<std::pair<std::string, std::string>> port_env_vars(const Session& session) {
    return {
        {"KILD_SESSION_ID", session.id},
        {"KILD_PORT_RANGE_START", std::to_string(session.port_range.base)},
        {"KILD_PORT_RANGE_END", std::to_string(session.port_range.last())},
        {"KILD_PORT_COUNT", std::to_string(session.port_range.count)},
    };
}

PortAllocator::PortAllocator(const SessionStore& store, uint16_t base_port)
    : store_(store)
    , base_port_(base_port)
{
}

Result<PortRange> PortAllocator::allocate(const std::string& project_id, uint16_t range_size) const {
    std::vector<PortRange> occupied;
    for (const auto& session : store_.list(project_id)) {
        occupied.push_back(session.port_range);
    }

    auto range = find_next_available_range(occupied, range_size, base_port_);
    if (range) {
        spdlog::debug("core.ports.allocated project_id={} base={} count={}",
            project_id, range->base, range->count);
    }
    return range;
}

void PortAllocator::release(const std::string& project_id, const PortRange& range) const {
    spdlog::debug("core.ports.released project_id={} base={} count={}", project_id, range.base, range.count);
}

}
