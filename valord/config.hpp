/*	BSD 3-Clause License

	Copyright (c) 2022, Paul Varga
	All rights reserved.

	Redistribution and use in source and binary forms, with or without
	modification, are permitted provided that the following conditions are met:

	1. Redistributions of source code must retain the above copyright notice, this
	   list of conditions and the following disclaimer.

	2. Redistributions in binary form must reproduce the above copyright notice,
	   this list of conditions and the following disclaimer in the documentation
	   and/or other materials provided with the distribution.

	3. Neither the name of the copyright holder nor the names of its
	   contributors may be used to endorse or promote products derived from
	   this software without specific prior written permission.

	THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
	AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
	IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
	DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
	FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
	DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
	SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
	CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
	OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
	OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#ifndef INC_VALORD__CONFIG_HPP
#define INC_VALORD__CONFIG_HPP

/**	@file
 *	Compile-time configuration shared by the valord headers. Every macro here
 *	may be defined before the first valord include to override its default.
 *
 *	VALORD_ASSERT checks internal invariants (the free list, the order index
 *	and slot occupancy agreeing with one another). It defaults to the standard
 *	assert and therefore disappears when NDEBUG is defined. Usage violations
 *	of the borrow discipline are not asserted; they always throw
 *	valord::borrow_error.
 *
 *	VALORD_TRACE receives a stream expression describing noteworthy but
 *	non-erroneous events: a new maximum published to watchers, a full order
 *	index rebuild, a stale order key found while detaching a slot. It is
 *	hollow by default. To see the events, for example:
 *
 *		#define VALORD_TRACE(MESSAGE) (std::clog << "valord: " << MESSAGE << std::endl)
 */

#include <cassert>

#if !defined(VALORD_ASSERT)
	/**	Transparently wraps assert to allow asserts to be turned off for valord containers in one location, if too costly.
	 */
	#define VALORD_ASSERT(CONDITION, ...) \
		/* Comment: __VA_ARGS__ */ \
		assert(CONDITION)
#endif // !VALORD_ASSERT

#if !defined(VALORD_TRACE)
	#define VALORD_TRACE(MESSAGE) do { } while (false)
#endif // !VALORD_TRACE

#if defined(__has_cpp_attribute)
	#if __has_cpp_attribute(likely)
		#define VALORD_LIKELY(EXPRESSION) (EXPRESSION) [[likely]]
	#endif // __has_cpp_attribute(likely)
	#if __has_cpp_attribute(unlikely)
		#define VALORD_UNLIKELY(EXPRESSION) (EXPRESSION) [[unlikely]]
	#endif // __has_cpp_attribute(unlikely)
#endif // __has_cpp_attribute
#if defined(__has_builtin)
	#if __has_builtin(__builtin_expect)
		#define VALORD_EXPECT(EXPRESSION, CONSTANT) (__builtin_expect((EXPRESSION), (CONSTANT)))
	#endif // __has_builtin(__builtin_expect)
#elif defined(__GNUC__)
	#define VALORD_EXPECT(EXPRESSION, CONSTANT) (__builtin_expect((EXPRESSION), (CONSTANT)))
#endif // __GNUC__
#if !defined(VALORD_LIKELY)
	#if defined(VALORD_EXPECT)
		#define VALORD_LIKELY(EXPRESSION) VALORD_EXPECT(!!(EXPRESSION), 1)
	#else // !VALORD_EXPECT
		#define VALORD_LIKELY(EXPRESSION) (EXPRESSION)
	#endif // !VALORD_EXPECT
#endif // !VALORD_LIKELY
#if !defined(VALORD_UNLIKELY)
	#if defined(VALORD_EXPECT)
		#define VALORD_UNLIKELY(EXPRESSION) VALORD_EXPECT(!!(EXPRESSION), 0)
	#else // !VALORD_EXPECT
		#define VALORD_UNLIKELY(EXPRESSION) (EXPRESSION)
	#endif // !VALORD_EXPECT
#endif // !VALORD_UNLIKELY

#endif
