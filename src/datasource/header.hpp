#pragma once

#include <string>

namespace datasource {

struct Header {
    std::string name_;
    std::string value_;
};

}  // namespace datasource
