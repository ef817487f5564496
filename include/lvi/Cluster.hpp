/*
 * This file is part of the LVI LabVIEW Interop Library
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#pragma once

#include <stddef.h>
#include <array>
#include <tuple>
#include <lvi/Unaligned.hpp>

namespace lvi {

  enum class Packing {
    Packed,   // 1-byte packing: every field directly follows the last
    Natural,  // every field at a multiple of its own alignment
  };

  // LabVIEW packs clusters to one byte in 32-bit builds and uses natural
  // alignment in 64-bit builds.
  constexpr Packing host_packing = sizeof(void *) == 4 ? Packing::Packed : Packing::Natural;


  namespace detail {
    constexpr size_t align_to(size_t value, size_t align) {
      return (value + align - 1) / align * align;
    }

    template <Packing P, typename... Ts>
    constexpr std::array<size_t, sizeof...(Ts)> cluster_offsets(void) {
      const size_t sizes[] = {sizeof(Ts)...};
      const size_t aligns[] = {alignof(Ts)...};
      std::array<size_t, sizeof...(Ts)> out{};
      size_t cursor = 0;
      for (size_t i = 0; i < sizeof...(Ts); i++) {
        if (P == Packing::Natural) cursor = align_to(cursor, aligns[i]);
        out[i] = cursor;
        cursor += sizes[i];
      }
      return out;
    }

    template <Packing P, typename... Ts>
    constexpr size_t cluster_size(void) {
      const size_t sizes[] = {sizeof(Ts)...};
      const size_t aligns[] = {alignof(Ts)...};
      size_t cursor = 0;
      size_t widest = 1;
      for (size_t i = 0; i < sizeof...(Ts); i++) {
        if (P == Packing::Natural) {
          cursor = align_to(cursor, aligns[i]);
          if (aligns[i] > widest) widest = aligns[i];
        }
        cursor += sizes[i];
      }
      return align_to(cursor, widest);
    }
  }  // namespace detail


  // The byte layout of a host cluster whose fields have types `Ts...` in
  // declaration order, under packing rule `P`. Access a field through
  // `field<I>`, which is an UnalignedField at the computed offset:
  //
  //   using Point = ClusterLayout<host_packing, uint8_t, double>;
  //   double y = Point::field<1>::read(base);
  template <Packing P, typename... Ts>
  struct ClusterLayout {
    static_assert(sizeof...(Ts) > 0, "a cluster needs at least one field");

    static constexpr Packing packing = P;
    static constexpr size_t field_count = sizeof...(Ts);
    static constexpr std::array<size_t, sizeof...(Ts)> offsets =
        detail::cluster_offsets<P, Ts...>();
    static constexpr size_t size = detail::cluster_size<P, Ts...>();

    template <size_t I>
    using type = typename std::tuple_element<I, std::tuple<Ts...>>::type;

    template <size_t I>
    static constexpr size_t offset = offsets[I];

    template <size_t I>
    using field = UnalignedField<type<I>, offsets[I]>;
  };
}  // namespace lvi
