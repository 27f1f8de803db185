#include <fusion/avm2/qname.h>

namespace fusion::avm2 {

QName QName::parse(std::string_view full) {
    if (auto pos = full.rfind("::"); pos != std::string_view::npos) {
        return QName(std::string(full.substr(0, pos)), std::string(full.substr(pos + 2)));
    }
    if (auto pos = full.rfind('.'); pos != std::string_view::npos) {
        return QName(std::string(full.substr(0, pos)), std::string(full.substr(pos + 1)));
    }
    return QName(std::string(full));
}

std::string QName::full_name() const {
    if (ns.empty()) return name;
    return ns + "." + name;
}

} // namespace fusion::avm2
