//
// src/OperatingSystem.cpp
//
#include <Kiln/Types/OS.hpp>

namespace Kiln {

// Fields of the wrong type are treated as absent.
OS OS::from_json(const json& j) {
    OS os_obj;
    if (!j.is_object()) return os_obj;
    if (j.contains("name") && j.at("name").is_string()) os_obj.name = j.at("name").get<std::string>();
    if (j.contains("arch") && j.at("arch").is_string()) os_obj.arch = j.at("arch").get<std::string>();
    return os_obj;
}

} // namespace Kiln
