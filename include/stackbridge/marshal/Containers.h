/***
 * Name: stackbridge::marshal (structural types)
 * Purpose: Marshal<T> for sequences, mappings, optionals, variants and tuples.
 * Inputs: Element types that are themselves marshalled
 * Outputs: Table slots, nil/value slots, or several consecutive slots (tuples)
 * Theory of Operation:
 *   - vector<T> is a sequence table with keys 1..n, written and read in
 *     ascending order. Reading stops at the table's border.
 *   - map/unordered_map become tables keyed by the marshalled keys and are read
 *     back in table iteration order with State::next.
 *   - A table element (vector item, map key or map value) must push exactly one
 *     non-nil slot; a nil would erase the entry, so push throws EncodeError
 *     instead and leaves the stack as it was. vector<optional<T>> with a
 *     nullopt therefore does not push.
 *   - optional<T>: nullopt <-> nil. An empty stack also reads as nullopt.
 *   - variant<Ts...> pushes the held alternative. Popping first tries, in
 *     declaration order, the alternatives whose own tag is the slot's tag
 *     (Integer -> integral, Number -> floating, ...), then falls back to the
 *     relaxed conversions in declaration order. variant<int, double> holding
 *     3.0 pops back as double.
 *   - tuple/pair occupy one slot per element, pushed left to right and popped
 *     right to left. Missing trailing slots read as nil.
 *   - Every element failure propagates unchanged and the stack is put back at the
 *     depth the operation documents (StackGuard).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "stackbridge/exceptions/marshal_error.h"
#include "stackbridge/marshal/Marshal.h"

namespace stackbridge::marshal {
    template<typename T>
    struct Marshal<std::vector<T> > {
        static int push(std::vector<T> value, vm::State &st) {
            StackGuard guard(st);
            st.new_table();
            int64_t index = 1;
            for (auto &&elem: value) {
                detail::push_element<T>(std::move(elem), st);
                st.raw_seti(-2, index++);
            }
            guard.dismiss();
            return 1;
        }

        static std::vector<T> pop(vm::State &st) {
            detail::expect_table(st);
            StackGuard guard(st, st.get_top() - 1);
            const int64_t n = st.raw_len(-1);
            std::vector<T> out;
            out.reserve(static_cast<std::size_t>(n));
            for (int64_t i = 1; i <= n; ++i) {
                st.raw_geti(-1, i);
                out.push_back(marshal::pop<T>(st));
            }
            return out;
        }
    };

    namespace detail {
        template<typename M>
        struct MapMarshal {
            using K = typename M::key_type;
            using V = typename M::mapped_type;

            static int push(M value, vm::State &st) {
                StackGuard guard(st);
                st.new_table();
                for (auto &entry: value) {
                    push_element<K>(entry.first, st);
                    push_element<V>(std::move(entry.second), st);
                    st.raw_set(-3);
                }
                guard.dismiss();
                return 1;
            }

            static M pop(vm::State &st) {
                expect_table(st);
                StackGuard guard(st, st.get_top() - 1);
                M out;
                st.push_nil();
                while (st.next(-2)) {
                    V val = marshal::pop<V>(st);
                    // Convert a copy so the original key stays for the next step.
                    st.push_value(st.at(-1));
                    K key = marshal::pop<K>(st);
                    out.insert_or_assign(std::move(key), std::move(val));
                }
                return out;
            }
        };
    } // namespace detail

    template<typename K, typename V, typename C, typename A>
    struct Marshal<std::map<K, V, C, A> > : detail::MapMarshal<std::map<K, V, C, A> > {
    };

    template<typename K, typename V, typename H, typename E, typename A>
    struct Marshal<std::unordered_map<K, V, H, E, A> > : detail::MapMarshal<std::unordered_map<K, V, H, E, A> > {
    };

    namespace detail {
        template<typename T>
        struct ExactTag<std::vector<T> > : TagIs<vm::TypeTag::Table> {};

        template<typename K, typename V, typename C, typename A>
        struct ExactTag<std::map<K, V, C, A> > : TagIs<vm::TypeTag::Table> {};

        template<typename K, typename V, typename H, typename E, typename A>
        struct ExactTag<std::unordered_map<K, V, H, E, A> > : TagIs<vm::TypeTag::Table> {};

        template<typename T>
        struct ExactTag<std::optional<T> > {
            static bool matches(vm::TypeTag tag) { return tag == vm::TypeTag::Nil || ExactTag<T>::matches(tag); }
        };

        template<typename... Us>
        struct ExactTag<std::variant<Us...> > {
            static bool matches(vm::TypeTag tag) { return (ExactTag<Us>::matches(tag) || ...); }
        };
    } // namespace detail

    template<typename T>
    struct Marshal<std::optional<T> > {
        static int push(std::optional<T> value, vm::State &st) {
            if (!value) {
                st.push_nil();
                return 1;
            }
            return Marshal<T>::push(std::move(*value), st);
        }

        static std::optional<T> pop(vm::State &st) {
            const vm::TypeTag tag = st.type_at(-1);
            if (tag == vm::TypeTag::None) { return std::nullopt; }
            if (tag == vm::TypeTag::Nil) {
                st.pop(1);
                return std::nullopt;
            }
            return marshal::pop<T>(st);
        }
    };

    template<typename... Ts>
    struct Marshal<std::variant<Ts...> > {
        static int push(std::variant<Ts...> value, vm::State &st) {
            return std::visit([&st](auto &alt) {
                return Marshal<std::decay_t<decltype(alt)> >::push(std::move(alt), st);
            }, value);
        }

        static std::variant<Ts...> pop(vm::State &st) {
            const vm::Value slot = detail::take_top(st, "variant");
            std::optional<std::variant<Ts...> > out;
            ((detail::ExactTag<Ts>::matches(slot.tag()) && try_alternative<Ts>(slot, st, out)) || ...);
            if (!out) { (try_alternative<Ts>(slot, st, out) || ...); }
            if (!out) { detail::mismatch("variant", slot); }
            return std::move(*out);
        }

    private:
        template<typename Alt>
        static bool try_alternative(const vm::Value &slot, vm::State &st, std::optional<std::variant<Ts...> > &out) {
            st.push_value(slot);
            try {
                out.emplace(std::in_place_type<Alt>, marshal::pop<Alt>(st));
                return true;
            } catch (const exceptions::MarshalError &) {
                // The alternative consumed its copy; the next one gets a fresh copy.
                return false;
            }
        }
    };

    template<typename... Ts>
    struct Marshal<std::tuple<Ts...> > {
        static int push(std::tuple<Ts...> value, vm::State &st) {
            StackGuard guard(st);
            int n = 0;
            std::apply([&st, &n](auto &... elems) {
                ((n += Marshal<std::decay_t<decltype(elems)> >::push(std::move(elems), st)), ...);
            }, value);
            guard.dismiss();
            return n;
        }

        static std::tuple<Ts...> pop(vm::State &st) {
            constexpr int width = static_cast<int>(sizeof...(Ts));
            const int top = st.get_top();
            const int base = top >= width ? top - width : 0;
            StackGuard guard(st, base);
            st.set_top(base + width);
            return pop_slots(st, std::index_sequence_for<Ts...>{});
        }

    private:
        template<std::size_t... I>
        static std::tuple<Ts...> pop_slots(vm::State &st, std::index_sequence<I...>) {
            constexpr std::size_t last = sizeof...(Ts) - 1;
            std::tuple<std::optional<Ts>...> parts;
            // Rightmost element first: it sits on top of the stack.
            ((std::get<last - I>(parts).emplace(
                marshal::pop<std::tuple_element_t<last - I, std::tuple<Ts...> > >(st))), ...);
            return std::tuple<Ts...>(std::move(*std::get<I>(parts))...);
        }
    };

    template<>
    struct Marshal<std::tuple<> > {
        static int push(std::tuple<>, vm::State &) { return 0; }

        static std::tuple<> pop(vm::State &) { return {}; }
    };

    template<typename A, typename B>
    struct Marshal<std::pair<A, B> > {
        static int push(std::pair<A, B> value, vm::State &st) {
            return Marshal<std::tuple<A, B> >::push(std::tuple<A, B>(std::move(value.first), std::move(value.second)), st);
        }

        static std::pair<A, B> pop(vm::State &st) {
            auto t = Marshal<std::tuple<A, B> >::pop(st);
            return std::pair<A, B>(std::move(std::get<0>(t)), std::move(std::get<1>(t)));
        }
    };
} // namespace stackbridge::marshal
