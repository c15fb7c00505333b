#include <lootbank/plugins/economy/economy_plugin.hpp>

#include <lootbank/protocol/config.hpp>

#include <fc/log/logger.hpp>

#include <boost/filesystem/path.hpp>

namespace lootbank { namespace plugins { namespace economy {

using std::string;

namespace bfs = boost::filesystem;
namespace bpo = boost::program_options;

namespace detail {

   class economy_plugin_impl {
   public:
      economy_plugin_impl() {}

      chain::database                                 db;
      chain::database::open_args                      open_args;
      chain::economy_config                           config;

      std::unique_ptr< protocol::init_data_verifier > verifier;
      std::unique_ptr< chain::weighted_selector >     selector;
      std::unique_ptr< chain::economy_ledger >        ledger;
      std::unique_ptr< economy_api >                  api;
   };

} // detail


economy_plugin::economy_plugin() {}
economy_plugin::~economy_plugin() {}

void economy_plugin::set_program_options(
   boost::program_options::options_description& cli,
   boost::program_options::options_description& cfg)
{
   cfg.add_options()
      ("shared-file-dir", bpo::value< bfs::path >()->default_value( "state" ),
         "the location of the store shared memory files (absolute path or relative to application data dir)")
      ("shared-file-size-mb", bpo::value< uint64_t >()->default_value( LOOTBANK_DEFAULT_SHARED_FILE_SIZE_MB ),
         "Size of the shared memory file in megabytes")
      ("bot-token", bpo::value< string >(),
         "Credential of the messaging platform bot. Identity payloads are signed with a key derived from it")
      ("starting-balance", bpo::value< int64_t >()->default_value( LOOTBANK_DEFAULT_STARTING_BALANCE ),
         "Balance granted to a user on first contact")
      ("sell-ratio", bpo::value< uint16_t >()->default_value( LOOTBANK_DEFAULT_SELL_RATIO ),
         "Share of an item's base price paid when it is sold, in basis points")
      ("selector-seed", bpo::value< uint64_t >(),
         "Seed for the draw engine. Unset seeds from the system entropy source")
      ("lock-wait-micro", bpo::value< uint64_t >()->default_value( LOOTBANK_DEFAULT_LOCK_WAIT_MICRO ),
         "Microseconds to wait for the store lock before giving up")
      ;
   cli.add_options()
      ("validate-invariants", bpo::bool_switch()->default_value(false),
         "Validate all store invariants when opening the store")
      ;
}

void economy_plugin::plugin_initialize(const boost::program_options::variables_map& options)
{ try {
   ilog( "Initializing economy plugin" );
   my = std::make_unique< detail::economy_plugin_impl >();

   auto sfd = options.at( "shared-file-dir" ).as< bfs::path >();
   if( sfd.is_relative() )
      my->open_args.shared_mem_dir = fc::path( appbase::app().data_dir() / sfd );
   else
      my->open_args.shared_mem_dir = fc::path( sfd );

   my->open_args.shared_file_size = options.at( "shared-file-size-mb" ).as< uint64_t >() * 1024 * 1024;
   my->open_args.lock_wait_micro = options.at( "lock-wait-micro" ).as< uint64_t >();
   my->open_args.do_validate_invariants = options.at( "validate-invariants" ).as< bool >();

   FC_ASSERT( options.count( "bot-token" ), "bot-token must be configured" );
   const string bot_token = options.at( "bot-token" ).as< string >();
   FC_ASSERT( !bot_token.empty(), "bot-token must not be empty" );
   my->verifier = std::make_unique< protocol::init_data_verifier >( bot_token );

   my->config.starting_balance = options.at( "starting-balance" ).as< int64_t >();
   my->config.sell_ratio = options.at( "sell-ratio" ).as< uint16_t >();

   if( options.count( "selector-seed" ) )
      my->selector = std::make_unique< chain::weighted_selector >( options.at( "selector-seed" ).as< uint64_t >() );
   else
      my->selector = std::make_unique< chain::weighted_selector >();

   ilog( "Economy configured with starting balance ${b} and sell ratio ${r}",
         ("b", my->config.starting_balance)("r", my->config.sell_ratio) );
} FC_LOG_AND_RETHROW() }

void economy_plugin::plugin_startup()
{ try {
   FC_ASSERT( my, "economy plugin has not been initialized" );
   ilog( "economy plugin:  plugin_startup() begin" );

   my->db.open( my->open_args );
   my->ledger = std::make_unique< chain::economy_ledger >( my->db, *my->selector, my->config );
   my->api = std::make_unique< economy_api >( my->db, *my->ledger, *my->verifier );

   ilog( "economy plugin:  plugin_startup() end" );
} FC_LOG_AND_RETHROW() }

void economy_plugin::plugin_shutdown()
{
   if( !my )
      return;

   try
   {
      ilog( "closing store" );
      my->api.reset();
      my->ledger.reset();
      my->db.close();
      ilog( "store closed successfully" );
   }
   catch(fc::exception& e)
   {
      edump( (e.to_detail_string()) );
   }
}

chain::database& economy_plugin::db()
{
   FC_ASSERT( my, "economy plugin has not been initialized" );
   return my->db;
}

economy_api& economy_plugin::api()
{
   FC_ASSERT( my && my->api, "economy plugin has not been started" );
   return *my->api;
}

const fc::path& economy_plugin::state_dir()const
{
   FC_ASSERT( my, "economy plugin has not been initialized" );
   return my->open_args.shared_mem_dir;
}

} } } // lootbank::plugins::economy
