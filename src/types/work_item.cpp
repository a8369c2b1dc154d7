#include <geotagger/types/work_item.hpp>

#include <sstream>
#include <stdexcept>

namespace
{
template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

namespace geotagger
{

std::string describe(const MetadataValue &value)
{
    return std::visit(overloaded{[](const std::string &text) { return "text \"" + text + "\""; },
                                 [](int64_t integer) { return "integer " + std::to_string(integer); },
                                 [](const RationalList &list) {
                                     std::ostringstream ss;
                                     ss << "rationals [";
                                     for (size_t i = 0; i < list.size(); i++)
                                     {
                                         ss << (i > 0 ? " " : "") << list[i].numerator << "/"
                                            << list[i].denominator;
                                     }
                                     ss << "]";
                                     return ss.str();
                                 },
                                 [](const Timestamp &ts) { return "timestamp " + toIsoString(ts); }},
                      value);
}

WorkItem::WorkItem(std::string identity, TagMap metadata)
    : _identity(std::move(identity)), _metadata(std::move(metadata))
{
}

bool WorkItem::contains(const std::string &tag) const
{
    return _metadata.find(tag) != _metadata.end();
}

const MetadataValue &WorkItem::get(const std::string &tag) const
{
    auto iter = _metadata.find(tag);
    if (iter == _metadata.end())
    {
        throw std::runtime_error("missing tag " + tag);
    }
    return iter->second;
}

void WorkItem::set(const std::string &tag, MetadataValue value)
{
    _metadata[tag] = std::move(value);
    _dirty = true;
}

void WorkItem::erase(const std::string &tag)
{
    if (_metadata.erase(tag) > 0)
    {
        _dirty = true;
    }
}

void WorkItem::throwWrongShape(const std::string &tag, const MetadataValue &value) const
{
    throw std::runtime_error("tag " + tag + " has unexpected " + describe(value));
}

} // namespace geotagger
