#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace comphub::registry::detail
{

// Set of component names that iterates in insertion order.
class OrderedNameSet
{
  public:
    /// @return true if `name` was not present before.
    bool insert(std::string_view name)
    {
        auto [it, inserted] = m_index.emplace(name);
        if (inserted)
        {
            m_order.emplace_back(name);
        }
        return inserted;
    }

    bool erase(std::string_view name)
    {
        if (m_index.erase(std::string(name)) == 0)
        {
            return false;
        }
        m_order.erase(std::find(m_order.begin(), m_order.end(), name));
        return true;
    }

    [[nodiscard]] bool contains(std::string_view name) const { return m_index.count(std::string(name)) != 0; }
    [[nodiscard]] bool empty() const noexcept { return m_order.empty(); }
    [[nodiscard]] size_t size() const noexcept { return m_order.size(); }
    [[nodiscard]] const std::vector<std::string> &items() const noexcept { return m_order; }

  private:
    std::vector<std::string> m_order;
    std::unordered_set<std::string> m_index;
};

} // namespace comphub::registry::detail
