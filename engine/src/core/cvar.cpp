#include "rigview/core/cvar.hpp"
#include "rigview/core/logger.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace rigview::core {

static std::unordered_map<std::string, ICVar*>& getCVarMap() {
    static std::unordered_map<std::string, ICVar*> map;
    return map;
}

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void CVarSystem::registerCVar(ICVar* cvar) {
  if (cvar == nullptr) {
    return;
  }
    auto& map = getCVarMap();
    if (map.contains(cvar->name)) {
      Logger::warn("CVar {} registered twice, keeping the first", cvar->name);
      return;
    }
    map[cvar->name] = cvar;
}

ICVar* CVarSystem::find(const std::string& name) {
    auto& map = getCVarMap();
    auto it = map.find(name);
    if (it != map.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::string> CVarSystem::names() {
    std::vector<std::string> result;
    result.reserve(getCVarMap().size());
    for (const auto& [name, cvar] : getCVarMap()) {
        result.push_back(name);
    }
    std::ranges::sort(result);
    return result;
}

void CVarSystem::resetAll() {
    for (const auto& [name, cvar] : getCVarMap()) {
        cvar->resetToDefault();
    }
}

void CVarSystem::saveToIni(const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            Logger::error("Cannot create {}: {}", path.parent_path().string(), ec.message());
            return;
        }
    }

    Logger::info("Saving CVars to: {}", std::filesystem::absolute(path).string());
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        Logger::error("Failed to open CVar file for writing: {}", path.string());
        return;
    }

    int savedCount = 0;
    for (const auto& name : names()) {
        const ICVar* cvar = find(name);
        if (cvar->flags & CVarFlags::save) {
            f << name << "=" << cvar->toString() << "\n";
            savedCount++;
        }
    }
    Logger::info("Successfully saved {} CVars", savedCount);
}

int CVarSystem::loadFromIni(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) {
        Logger::debug("CVar file not found: {}", path.string());
        return 0;
    }
    Logger::info("Loading CVars from: {}", std::filesystem::absolute(path).string());

    int loadedCount = 0;
    std::string line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }
        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        const std::string name = trim(line.substr(0, eq));
        const std::string val = trim(line.substr(eq + 1));

        ICVar* cvar = find(name);
        if (cvar == nullptr) {
            Logger::warn("Unknown CVar in {}: {}", path.string(), name);
            continue;
        }
        if (cvar->flags & CVarFlags::read_only) {
            Logger::warn("CVar {} is read-only, ignoring value {}", name, val);
            continue;
        }
        try {
            cvar->setFromString(val);
            loadedCount++;
        } catch (const std::invalid_argument&) {
            Logger::warn("Failed to set CVar {} from string value: {}", name, val);
        } catch (const std::out_of_range&) {
            Logger::warn("Value out of range for CVar {}: {}", name, val);
        }
    }
    Logger::info("Successfully loaded {} CVars", loadedCount);
    return loadedCount;
}

}
