/*
 * Isomorph - Deep structural equality for dynamically typed values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

namespace iso {

/**
 * Relaxations of deep equality
 *
 * Read-only for the duration of a comparison.
 *
 * \ingroup equality
 */
struct equality_options {
  /** Distinguish an array hole from an explicit undefined at the same index */
  bool strict_sparse_arrays = false;
  /** Unwrap boxed primitives before comparing */
  bool normalize_boxed_primitives = false;
  /** Compare plain objects with different prototypes by their properties */
  bool allow_prototype_mismatch = false;
};

} // namespace iso
