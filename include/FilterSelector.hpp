// Ordered, cyclic list of the filters the viewer can switch between.

#pragma once

#include "Filter.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

class FilterSelector
{
public:
    explicit FilterSelector(std::vector<Filter> filters)
        : filters_(std::move(filters))
    {
        if (filters_.empty())
        {
            throw std::invalid_argument("FilterSelector requires at least one filter.");
        }
    }

    [[nodiscard]] const Filter& current() const
    {
        return filters_[index_];
    }

    // Advances to the next filter, wrapping to the first past the end.
    const Filter& next()
    {
        index_ = (index_ + 1) % filters_.size();
        return current();
    }

    [[nodiscard]] std::size_t index() const { return index_; }
    [[nodiscard]] std::size_t size() const { return filters_.size(); }

private:
    std::vector<Filter> filters_;
    std::size_t index_ = 0;
};
