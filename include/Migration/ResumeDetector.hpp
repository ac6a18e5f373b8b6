#pragma once
#include "Core/interfaces/IHypervisorDomain.hpp"
#include <set>
#include <string>

// Finds block jobs left running by an earlier, interrupted run.
class ResumeDetector {
public:
    // Devices among @p candidates with a block job reported, whatever its progress.
    [[nodiscard]] static std::set<std::string> findOngoing(IHypervisorDomain& domain,
                                                           const std::set<std::string>& candidates);
};
