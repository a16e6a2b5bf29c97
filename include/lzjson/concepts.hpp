//
// Defines the input concepts in LZJSON and type traits to detect them.
//

#ifndef LZJSON_CONCEPTS_HPP
#define LZJSON_CONCEPTS_HPP

#include "internal/core.hpp"

namespace lzjson {

//
// true if T implements:
//
// - char_type peek(); 
//   Get character. If end(), behavior is undefined.
// - char_type take();
//   Extract character. If end(), behavior is undefined.
// - size_type ipos(); 
//   Get input position.
// - bool end(); 
//   True if input has run out of characters.
// - rewind();
//   Jump to the beginning of the input.
//
// And has typedefs:
// - char_type = CharT
// - size_type: unsigned integral type large enough
//   to hold the maximum input size
// - input_kind: an I/O tag type that is at least io_basic
//
template <typename T, typename CharT>
using is_basic_input = iutil::is_basic_input<T, CharT>;

//
// Same as is_basic_input<T, CharT>, but all functions are noexcept.
//
template <typename T, typename CharT>
using is_nothrow_basic_input = iutil::is_nothrow_basic_input<T, CharT>;

//
// true if T satisfies is_basic_input<T, CharT> and implements:
// 
// - const char_type* ipbeg() const;
//   Pointer to the first char in the stream.
//
// - const char_type* ipend() const;
//   Pointer to one past the last char in the stream.
// 
// - const char_type* ipcur() const;
//   Pointer to the next char returned by peek() or take().
// 
// - icommit(size_type count);
//   Mark the next count characters in the stream as read.
//   If count is greater than the number of chars remaining
//   in the stream, the behavior is undefined. After this 
//   call, ipos() increases by count.
// 
// And has typedefs:
// - input_kind: an I/O tag type that is at least io_contiguous
//
// The following conditions must also hold:
// - ipbeg() <= ipcur() <= ipend()
// - ipbeg() and ipend() remain unchanged after calls
//   to peek(), take(), ipos(), end(), rewind(), or any 
//   const member functions.
//
// A contiguous input is sliceable: cursors return views
// into it instead of copies where they can.
//
template <typename T, typename CharT>
using is_contiguous_input = iutil::is_contiguous_input<T, CharT>;

//
// Same as is_contiguous_input<T, CharT>, but all functions are noexcept.
//
template <typename T, typename CharT>
using is_nothrow_contiguous_input = iutil::is_nothrow_contiguous_input<T, CharT>;

}

#endif
