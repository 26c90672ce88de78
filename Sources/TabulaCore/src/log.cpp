#include "tabula/log.hpp"
#include <cctype>

namespace tabula {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

bool parse_log_level(const std::string& name, log_level& out) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lowered == "off") { out = log_level::off; return true; }
    if (lowered == "error") { out = log_level::error; return true; }
    if (lowered == "warn" || lowered == "warning") { out = log_level::warn; return true; }
    if (lowered == "info") { out = log_level::info; return true; }
    if (lowered == "debug") { out = log_level::debug; return true; }
    return false;
}

} // namespace tabula
