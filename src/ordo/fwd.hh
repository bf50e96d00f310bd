#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>


namespace ordo
{

//
// Primitives
//

// signed size type
// Sizes, positions and slice arguments are all signed: a negative start or length is simply
// "out of range" and yields an empty slice instead of wrapping around to a huge unsigned value.
using isize = std::int64_t;

//
// Diagnostics
//

struct render_config;
struct key_not_found_error;

//
// Container
//

template <class K, class V, class HashT = std::hash<K>, class EqualT = std::equal_to<K>>
struct ordered_map;

//
// Enumeration protocol
//

enum class step_kind;
enum class reduction_status;

template <class Acc>
struct step;
template <class Map>
struct cursor;
template <class Acc, class Map>
struct reduction;

} // namespace ordo
