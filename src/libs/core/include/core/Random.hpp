/*
 * Copyright (C) 2020 Emeric Poupon
 *
 * This file is part of hlsforge.
 *
 * hlsforge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * hlsforge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with hlsforge.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <random>

namespace hlsforge::core::random
{
    using RandGenerator = std::mt19937;
    RandGenerator& getRandGenerator();

    template<typename T>
    T getRandom(T min, T max)
    {
        std::uniform_int_distribution<int> dist{ static_cast<int>(min), static_cast<int>(max) };
        return static_cast<T>(dist(getRandGenerator()));
    }
} // namespace hlsforge::core::random
