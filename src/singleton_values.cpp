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


#include "isomorph/value.hpp"
#include "isomorph/stl/unordered_map.hpp"


////////////////////////////////////////////////////////////////////////////////
//
//                          Undefined and null
//
static
iso::object undefined_object {iso::tag::undefined}, null_object {iso::tag::null};
const iso::value iso::undefined {&undefined_object};
const iso::value iso::null {&null_object};

////////////////////////////////////////////////////////////////////////////////
//
//                              Booleans
//
static iso::object*
_initialize_boolean(iso::object *ptr, bool val)
{
  ptr->boolean = val;
  return ptr;
}

static
iso::object True_object {iso::tag::boolean}, False_object {iso::tag::boolean};
const iso::value iso::True {_initialize_boolean(&True_object, true)},
                 iso::False {_initialize_boolean(&False_object, false)};

////////////////////////////////////////////////////////////////////////////////
//
//                             Prototypes
//
const iso::prototype iso::object_prototype {"Object"};
const iso::prototype iso::function_prototype {"Function"};
const iso::prototype iso::array_prototype {"Array"};
const iso::prototype iso::date_prototype {"Date"};
const iso::prototype iso::regexp_prototype {"RegExp"};
const iso::prototype iso::typed_array_prototype {"TypedArray"};
const iso::prototype iso::set_prototype {"Set"};
const iso::prototype iso::map_prototype {"Map"};
const iso::prototype iso::string_prototype {"String"};
const iso::prototype iso::number_prototype {"Number"};
const iso::prototype iso::boolean_prototype {"Boolean"};

const iso::prototype*
iso::make_prototype(std::string_view name)
{ return make<prototype>(copy_string(name).data()); }

static
iso::stl::unordered_map<std::string_view, const iso::prototype*> g_prototypes;

const iso::prototype*
iso::named_prototype(std::string_view name)
{
  const auto it = g_prototypes.find(name);
  if (it != g_prototypes.end())
    return it->second;

  const prototype *proto = make_prototype(name);
  g_prototypes.emplace(proto->name, proto);
  return proto;
}
