// stacksynth/basic/diagnostic_codes.hpp - Stable diagnostic codes
//
// E01xx: construct tree / reference graph
// E02xx: environment
// E03xx: stack definition files
// E04xx: output
//
#pragma once

namespace stacksynth::diag_code
{

/// A token whose owner is not a construct of the same tree.
inline constexpr const char * k_dangling_reference = "E0101";

/// A construct input references one of the construct's own attributes.
inline constexpr const char * k_self_reference = "E0102";

/// The reference graph contains a cycle.
inline constexpr const char * k_cyclic_dependency = "E0103";

/// A token reached the emitter unresolved (internal invariant violation).
inline constexpr const char * k_unresolved_token = "E0104";

inline constexpr const char * k_duplicate_construct = "E0105";
inline constexpr const char * k_finalized_tree = "E0106";
inline constexpr const char * k_invalid_reference = "E0107";
inline constexpr const char * k_invalid_document_path = "E0108";

inline constexpr const char * k_missing_environment = "E0201";

inline constexpr const char * k_stack_file = "E0301";

inline constexpr const char * k_output_write = "E0401";

/// A resolved value has no representation in the target document format.
inline constexpr const char * k_emission_failed = "E0402";

}  // namespace stacksynth::diag_code
