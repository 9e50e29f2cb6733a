// src/attrs/attribute_names.hpp
#pragma once

namespace ddattr::attr {

// shape attributes (any partitioned dataset)
inline constexpr const char* keys             = "keys";
inline constexpr const char* key_hashes       = "keyHashes";
inline constexpr const char* tot_object_size  = "totObjectSize";
inline constexpr const char* split_size_distn = "splitSizeDistn";
inline constexpr const char* n_div            = "nDiv";
inline constexpr const char* example          = "example";

// tabular attributes
inline constexpr const char* n_row            = "nRow";
inline constexpr const char* split_row_distn  = "splitRowDistn";
inline constexpr const char* summary          = "summary";
inline constexpr const char* vars             = "vars";

}
