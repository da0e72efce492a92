#ifndef YCURVE_REGISTRY_H
#define YCURVE_REGISTRY_H

#include <ycurve/utils/Errors.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * Name -> constructor map for one strategy family
 *
 * Keys are compared lower-case, so "Linear", "LINEAR" and "linear" resolve to the same entry;
 * names() reports the spelling used at registration.
 * A failed lookup throws UnknownStrategyError naming the family and every registered name.
 *
 * @tparam Product Strategy interface, e.g. Interpolator or Bootstrapper<BondRecord>
 */
template <typename Product>
class Registry
{
public:
    using Constructor = std::function<std::shared_ptr<const Product>()>;

    explicit Registry(std::string family)
        : _family(std::move(family))
    {
    }

    // replaces an existing entry with the same name
    void add(const std::string& name, Constructor constructor)
    {
        if (name.empty()) {
            throw ValidationError("Registry<" + _family + ">: name must not be empty");
        }
        if (!constructor) {
            throw ValidationError("Registry<" + _family + ">: constructor for '" + name + "' is empty");
        }
        _constructors[key(name)] = Entry{name, std::move(constructor)};
    }

    std::shared_ptr<const Product> get(const std::string& name) const
    {
        auto it = _constructors.find(key(name));
        if (it == _constructors.end()) {
            throw UnknownStrategyError("Unknown " + _family + ": '" + name + "'. Available: " +
                                       boost::algorithm::join(names(), ", "));
        }
        return it->second.constructor();
    }

    bool contains(const std::string& name) const { return _constructors.count(key(name)) > 0; }

    std::vector<std::string> names() const
    {
        std::vector<std::string> result;
        result.reserve(_constructors.size());
        for (const auto& entry : _constructors) {
            result.push_back(entry.second.name);
        }
        return result;
    }

    const std::string& family() const { return _family; }

private:
    struct Entry {
        std::string name;
        Constructor constructor;
    };

    std::string _family;
    std::map<std::string, Entry> _constructors;     // keyed by lower-case name

    static std::string key(const std::string& name) { return boost::algorithm::to_lower_copy(name); }
};

#endif //YCURVE_REGISTRY_H
