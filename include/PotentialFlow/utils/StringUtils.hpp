// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <vector>
#include <string>
#include <sstream>
#include <iterator>

namespace pflow
{
    namespace utils
    {

        template <typename T>
        std::string join(const T &container, const std::string &delimiter = ", ")
        {
            if (std::begin(container) == std::end(container))
            {
                return "";
            }

            std::stringstream ss;
            auto it = std::begin(container);
            ss << *it;
            for (++it; it != std::end(container); ++it)
            {
                ss << delimiter << *it;
            }

            return ss.str();
        }

        inline std::string toLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace utils
} // namespace pflow
