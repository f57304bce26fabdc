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

#ifndef INC_VALORD__ORD_BY_HPP
#define INC_VALORD__ORD_BY_HPP

#include <type_traits>
#include <utility>

namespace valord
{
	/**	The ordering projection of a value: the order key by which a valord_map sorts its entries.
	 *	@details The primary template projects a value onto itself, for naturally ordered types. A value type may instead
	 *	provide a const member function ord_by() returning (a reference to) its order key, or specialize this template
	 *	with a const call operator. Either way the projection must be pure: calling it twice on an unchanged value must
	 *	yield equivalent keys.
	 *	@tparam T The value type.
	 */
	template <typename T, typename = void>
	struct ord_by
	{
		constexpr const T& operator()(const T& value) const noexcept
		{
			return value;
		}
	};

	/**	Specialized template for value types that expose their order key through a member ord_by().
	 *	@tparam T The value type.
	 */
	template <typename T>
	struct ord_by<T, std::void_t<decltype(std::declval<const T&>().ord_by())>>
	{
		constexpr decltype(auto) operator()(const T& value) const
			noexcept(noexcept(value.ord_by()))
		{
			return value.ord_by();
		}
	};

	/**	The order key type of a value type: the decayed result of its ord_by projection.
	 *	@tparam T The value type.
	 */
	template <typename T>
	using order_key_t = std::decay_t<std::invoke_result_t<const ord_by<T>&, const T&>>;

	/**	Used to determine if the order key of a value type is usable as a sorting key.
	 *	@tparam T The value type.
	 */
	template <typename T, typename = void>
	constexpr bool is_orderable_v = false;

	template <typename T>
	constexpr bool is_orderable_v<T, std::void_t<
			order_key_t<T>,
			decltype(std::declval<const order_key_t<T>&>() < std::declval<const order_key_t<T>&>())
		>> = std::is_copy_constructible_v<order_key_t<T>>;

	/**	Project a value onto its order key, copying the key out of the value.
	 *	@param value The value to project.
	 *	@return An independent copy of the order key.
	 */
	template <typename T>
	order_key_t<T> order_key_of(const T& value)
	{
		return order_key_t<T>(ord_by<T>{}(value));
	}
} // namespace valord

#endif
