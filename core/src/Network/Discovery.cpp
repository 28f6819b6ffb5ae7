#include "adbee/Network/Discovery.h"

namespace Adbee {

ServiceTypeParts splitServiceType(const std::string& serviceType) {
    std::string value = serviceType;
    while (!value.empty() && value.back() == '.') {
        value.pop_back();
    }

    ServiceTypeParts parts;
    size_t protoPos = value.find("._tcp");
    if (protoPos == std::string::npos) {
        protoPos = value.find("._udp");
    }
    if (protoPos == std::string::npos) {
        parts.regType = value;
        return parts;
    }

    size_t regEnd = protoPos + 5;    // длина "._tcp"
    parts.regType = value.substr(0, regEnd);

    if (regEnd < value.size() && value[regEnd] == '.') {
        std::string domain = value.substr(regEnd + 1);
        if (!domain.empty()) {
            parts.domain = domain + ".";
        }
    }
    return parts;
}

ServiceEventKind classifyBrowseReply(KnownInstances& known,
                                     const std::string& name,
                                     uint32_t interfaceIndex,
                                     bool isAdd) {
    auto it = known.find(name);

    if (isAdd) {
        if (it == known.end()) {
            known[name].insert(interfaceIndex);
            return ServiceEventKind::Added;
        }
        it->second.insert(interfaceIndex);
        return ServiceEventKind::Updated;
    }

    if (it == known.end()) {
        return ServiceEventKind::Removed;
    }
    it->second.erase(interfaceIndex);
    if (!it->second.empty()) {
        return ServiceEventKind::Updated;   // Ещё виден на другом интерфейсе
    }
    known.erase(it);
    return ServiceEventKind::Removed;
}

} // namespace Adbee
