// Copyright (C) 2020-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "blockfeed.hpp"
#include "mainloop.hpp"
#include "rpcserver.hpp"

#include <fhetrade/database.hpp>
#include <fhetrade/events.hpp>
#include <fhetrade/localoracle.hpp>
#include <fhetrade/market.hpp>
#include <fheutil/cryptorand.hpp>
#include <fheutil/hex.hpp>
#include <fheutil/uint256.hpp>

#include <jsonrpccpp/server/connectors/httpserver.h>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <sqlite3.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace
{

namespace fs = std::filesystem;

DEFINE_string (datadir, "",
               "data directory in which the state database is kept");

DEFINE_string (owner, "",
               "initial owner of the market, used when the database"
               " is created");
DEFINE_string (contract_id, "",
               "contract identity as hex string, used when the database"
               " is created (random if empty)");

DEFINE_string (blocks_file, "",
               "file with blocks to process, one JSON object per line"
               " ('-' for stdin)");
DEFINE_bool (auto_fulfil, false,
             "whether the local oracle should answer outstanding decryption"
             " requests after each block");
DEFINE_string (oracle_key, "",
               "secret key of the local oracle as hex string"
               " (random if empty)");

DEFINE_int32 (rpc_port, 0,
              "the port at which the JSON-RPC server will be started"
              " (if non-zero)");
DEFINE_bool (rpc_listen_locally, true,
             "whether the JSON-RPC server should listen locally");

/** File name of the state database inside the data directory.  */
constexpr const char* DB_FILE = "fhetrade.sqlite";

/**
 * Returns the path to the database file, creating the data directory
 * as needed.
 */
std::string
GetDatabaseFile (const std::string& datadir)
{
  const fs::path dir(datadir);
  if (fs::is_directory (dir))
    LOG (INFO) << "Using existing data directory: " << dir;
  else
    {
      LOG (INFO) << "Creating data directory: " << dir;
      CHECK (fs::create_directories (dir));
    }

  return (dir / DB_FILE).string ();
}

/**
 * Processes all blocks from the configured input, if any.
 */
void
FeedBlocks (fhetrade::BlockFeed& feed)
{
  if (FLAGS_blocks_file.empty ())
    {
      LOG (INFO) << "No block input configured";
      return;
    }

  if (FLAGS_blocks_file == "-")
    {
      LOG (INFO) << "Reading blocks from stdin";
      feed.ProcessStream (std::cin);
      return;
    }

  LOG (INFO) << "Reading blocks from " << FLAGS_blocks_file;
  std::ifstream in(FLAGS_blocks_file);
  CHECK (in) << "Failed to open blocks file " << FLAGS_blocks_file;
  feed.ProcessStream (in);
}

} // anonymous namespace

int
main (int argc, char** argv)
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Run the confidential trading daemon");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  if (FLAGS_datadir.empty ())
    {
      std::cerr << "Error: --datadir must be specified" << std::endl;
      return EXIT_FAILURE;
    }
  if (FLAGS_owner.empty ())
    {
      std::cerr << "Error: --owner must be set" << std::endl;
      return EXIT_FAILURE;
    }

  fhetrade::CryptoRand rnd;

  fhetrade::uint256 contract;
  if (FLAGS_contract_id.empty ())
    contract = rnd.Get<fhetrade::uint256> ();
  else if (!contract.FromHex (FLAGS_contract_id))
    {
      std::cerr << "Error: --contract_id is invalid" << std::endl;
      return EXIT_FAILURE;
    }

  std::string oracleKey;
  if (FLAGS_oracle_key.empty ())
    oracleKey = rnd.GetBytes (fhetrade::uint256::NUM_BYTES);
  else if (!fhetrade::HexToBytes (FLAGS_oracle_key, oracleKey)
              || oracleKey.empty ())
    {
      std::cerr << "Error: --oracle_key is invalid" << std::endl;
      return EXIT_FAILURE;
    }

  try
    {
      fhetrade::SQLiteDatabase db(GetDatabaseFile (FLAGS_datadir),
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
      fhetrade::LocalOracle oracle(oracleKey);
      fhetrade::SQLiteEventLog events(db);

      fhetrade::Market market(db, oracle, events);
      market.Initialise (FLAGS_owner, contract);

      fhetrade::BlockFeed feed(market);
      if (FLAGS_auto_fulfil)
        feed.EnableAutoFulfil (oracle);

      if (FLAGS_rpc_port == 0)
        {
          LOG (WARNING)
              << "No RPC port has been configured,"
                 " no RPC interface will be available";
          FeedBlocks (feed);
          return EXIT_SUCCESS;
        }

      LOG (INFO) << "Starting JSON-RPC HTTP server at port " << FLAGS_rpc_port;
      jsonrpc::HttpServer conn(FLAGS_rpc_port);
      if (FLAGS_rpc_listen_locally)
        conn.BindLocalhost ();

      fhetrade::MainLoop loop;
      fhetrade::RpcServer rpc(market, events, oracle, loop, conn);

      loop.Run ([&rpc, &feed] ()
        {
          CHECK (rpc.StartListening ()) << "Failed to start RPC server";
          FeedBlocks (feed);
        },
        [&rpc] ()
        {
          rpc.StopListening ();
        });
    }
  catch (const std::exception& exc)
    {
      LOG (FATAL) << "Exception caught: " << exc.what ();
    }

  return EXIT_SUCCESS;
}
