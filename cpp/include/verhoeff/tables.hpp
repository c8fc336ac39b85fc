// include/verhoeff/tables.hpp
#pragma once
#include <cstdint>

namespace verhoeff {

// Cayley table of the dihedral group D5 (digits 0-4 rotations, 5-9
// reflections). D_TABLE[c][x] folds permuted digit x into accumulator c.
inline constexpr std::uint8_t D_TABLE[10][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6}, {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8}, {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2}, {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4}, {9, 8, 7, 6, 5, 4, 3, 2, 1, 0}};

// Position permutations; row i applies to the digit i places from the end
// (mod 8). Row 0 is the identity, row k is row 1 applied k times.
inline constexpr std::uint8_t P_TABLE[8][10] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}, {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2}, {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0}, {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5}, {7, 0, 4, 6, 9, 1, 3, 2, 5, 8}};

// INV_TABLE[x] is the y with D_TABLE[x][y] == 0.
inline constexpr std::uint8_t INV_TABLE[10] = {0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

inline constexpr unsigned PERMUTATION_PERIOD = 8;

} // namespace verhoeff
