// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/* This file is the head of the generated schema.cpp.  The build inserts
   the content of schema.sql right after it, followed by schema_tail.cpp.  */

#include "fhetrade/schema.hpp"

#include <glog/logging.h>

namespace fhetrade
{

namespace
{

constexpr const char* SCHEMA_SQL = R"(
