#pragma once

#include "core/error.h"
#include "core/types.h"
#include <string>
#include <utility>
#include <vector>

namespace kild {

class SessionStore;

// Computes port ranges from the current Session Store snapshot. Nothing is
// reserved here: a range is held only once the owning session is saved, so two
// concurrent creates can compute the same range.
class PortAllocator {
public:
    PortAllocator(const SessionStore& store, uint16_t base_port);

    Result<PortRange> allocate(const std::string& project_id, uint16_t range_size) const;

    // Ranges are released by deleting the session record; this only logs.
    void release(const std::string& project_id, const PortRange& range) const;

private:
    const SessionStore& store_;
    uint16_t base_port_;
};

// Lowest range of `count` ports at or above `base_port` that intersects none of `occupied`.
Result<PortRange> find_next_available_range(const std::vector<PortRange>& occupied,
                                            uint16_t count, uint16_t base_port);

bool is_range_available(const std::vector<Session>& sessions, const PortRange& candidate);

std::vector<std::pair<std::string, std::string>> port_env_vars(const Session& session);

}
