// rootio – base of everything a directory can hand out
#pragma once

#include <memory>
#include <string>

namespace rootio {

class Object {
public:
    virtual ~Object() = default;
    virtual std::string class_name() const = 0;
};

using ObjectPtr = std::shared_ptr<Object>;

} // namespace rootio
