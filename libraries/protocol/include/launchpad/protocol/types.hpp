/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/seq/transform.hpp>
#include <boost/preprocessor/seq/enum.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/cat.hpp>

#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <launchpad/protocol/object_id.hpp>
#include <launchpad/protocol/config.hpp>

#define LAUNCHPAD_NAME_TO_OBJECT_TYPE(x, prefix, name) BOOST_PP_CAT(prefix, BOOST_PP_CAT(name, _object_type))
#define LAUNCHPAD_DECLARE_ID(x, space_prefix_seq, name) \
    using BOOST_PP_CAT(name, _id_type) = object_id<BOOST_PP_TUPLE_ELEM(2, 0, space_prefix_seq), \
                            LAUNCHPAD_NAME_TO_OBJECT_TYPE(x, BOOST_PP_TUPLE_ELEM(2, 1, space_prefix_seq), name)>;

/**
 * Declares the object type enumeration of a space and one object_id alias per name, e.g. launch_id_type.
 */
#define LAUNCHPAD_DEFINE_IDS(id_namespace, object_space, object_type_prefix, names_seq) \
   namespace launchpad { namespace id_namespace { \
   \
   enum BOOST_PP_CAT(object_type_prefix, object_type) { \
      BOOST_PP_SEQ_ENUM(BOOST_PP_SEQ_TRANSFORM(LAUNCHPAD_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq)) \
   }; \
   \
   BOOST_PP_SEQ_FOR_EACH(LAUNCHPAD_DECLARE_ID, (object_space, object_type_prefix), names_seq) \
   \
   } } \
   \
   FC_REFLECT_ENUM(launchpad::id_namespace::BOOST_PP_CAT(object_type_prefix, object_type), \
                   BOOST_PP_SEQ_TRANSFORM(LAUNCHPAD_NAME_TO_OBJECT_TYPE, object_type_prefix, names_seq))

namespace launchpad { namespace protocol {
   using namespace launchpad::db;

   using std::map;
   using std::vector;
   using std::string;
   using std::shared_ptr;
   using std::unique_ptr;
   using std::pair;

   using fc::variant;
   using fc::variant_object;
   using fc::optional;
   using fc::time_point_sec;
   using fc::time_point;
   using fc::safe;
   using fc::flat_map;
   using fc::flat_set;
   using fc::static_variant;

   enum reserved_spaces {
      relative_protocol_ids = 0,
      protocol_ids          = 1,
      implementation_ids    = 2
   };

   using share_type = safe<int64_t>;
   using bps_type = uint16_t;

} } // launchpad::protocol

LAUNCHPAD_DEFINE_IDS(protocol, protocol_ids, /*protocol objects are not prefixed*/,
                     (null)
                     (account)
                     (asset)
                     (launch)
                     (position)
                     (vault))

FC_REFLECT_ENUM( launchpad::protocol::reserved_spaces, (relative_protocol_ids)(protocol_ids)(implementation_ids) )
