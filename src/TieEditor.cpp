#include "holofit/TieEditor.hpp"
#include <stdexcept>
#include <string>

namespace holofit {

void retarget_map_in_place(Map& map, const Renumbering& renumber)
{
    std::visit([&](auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, SlotRef>) {
            if (n.index >= renumber.size())
                throw std::out_of_range("retarget: slot " + std::to_string(n.index) +
                                        " is not covered by the renumbering");
            n.index = renumber[n.index];
        } else if constexpr (std::is_same_v<T, Sequence>) {
            for (auto& it : n.items) retarget_map_in_place(it, renumber);
        } else if constexpr (std::is_same_v<T, Apply>) {
            for (auto& a : n.args) retarget_map_in_place(a, renumber);
        }
    }, map.node());
}

Map retarget_map(const Map& map, const Renumbering& renumber)
{
    Map out = map;
    retarget_map_in_place(out, renumber);
    return out;
}

} // namespace holofit
