)";

} // anonymous namespace

void
SetupDatabaseSchema (SQLiteDatabase& db)
{
  LOG (INFO) << "Setting up the database schema for fhetrade...";
  db.Execute (SCHEMA_SQL);
}

} // namespace fhetrade
