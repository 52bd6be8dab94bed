// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef FHETRADE_EVENTS_HPP
#define FHETRADE_EVENTS_HPP

#include "database.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>

namespace fhetrade
{

/**
 * Interface for a receiver of notifications about state transitions.
 * Events are purely informational for external observers; the core never
 * reads them back.
 */
class EventSink
{

public:

  EventSink () = default;
  virtual ~EventSink () = default;

  EventSink (const EventSink&) = delete;
  void operator= (const EventSink&) = delete;

  /**
   * Records a new event of the given type.  The data is a JSON object
   * with type-specific fields.
   */
  virtual void Emit (const std::string& type, const Json::Value& data) = 0;

};

/**
 * Event sink that appends events to the "events" table of the state
 * database.  Since it writes through the same connection as the operation
 * that emits the event, a rolled-back operation also drops its events.
 */
class SQLiteEventLog : public EventSink
{

private:

  /** The database holding the event table.  */
  SQLiteDatabase& db;

public:

  explicit SQLiteEventLog (SQLiteDatabase& d)
    : db(d)
  {}

  void Emit (const std::string& type, const Json::Value& data) override;

  /**
   * Returns up to the given number of events with ID at least the given one,
   * as JSON array of objects with "id", "type" and "data".
   */
  Json::Value GetEvents (int64_t fromId, unsigned limit) const;

};

} // namespace fhetrade

#endif // FHETRADE_EVENTS_HPP
