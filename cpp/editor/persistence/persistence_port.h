#pragma once

#include "editor/core/types.h"

#include <optional>

// Host-supplied storage for the design document. The format and medium are
// the host's concern. Implementations report failures by throwing.
class PersistencePort {
public:
    virtual ~PersistencePort() = default;

    virtual void save(const Design& design) = 0;
    // nullopt when nothing has been stored yet.
    virtual std::optional<Design> load() = 0;
};
