#include "Migration/ResumeDetector.hpp"
#include "Utils/Logger.hpp"

std::set<std::string> ResumeDetector::findOngoing(IHypervisorDomain& domain, const std::set<std::string>& candidates) {
    std::set<std::string> ongoing;
    for (const auto& device : candidates) {
        if (auto job = domain.blockJobInfo(device)) {
            BoostLogger::Info("Found block job on ", device, " (", job->percent(), "%)");
            ongoing.insert(device);
        }
    }
    return ongoing;
}
