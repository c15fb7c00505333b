#pragma once

#include <lootbank/plugins/economy/economy_api.hpp>

#include <appbase/application.hpp>

#define LOOTBANK_ECONOMY_PLUGIN_NAME "economy"

namespace lootbank { namespace plugins { namespace economy {

namespace detail { class economy_plugin_impl; }

/**
 * Owns the store and the economy components. The store opens at startup and
 * closes at shutdown; the components are built from configuration.
 */
class economy_plugin : public appbase::plugin< economy_plugin >
{
public:
   APPBASE_PLUGIN_REQUIRES()

   economy_plugin();
   virtual ~economy_plugin();

   static const std::string& name() { static std::string name = LOOTBANK_ECONOMY_PLUGIN_NAME; return name; }

   virtual void set_program_options(
      boost::program_options::options_description &command_line_options,
      boost::program_options::options_description &config_file_options
      ) override;

   virtual void plugin_initialize(const boost::program_options::variables_map& options) override;
   virtual void plugin_startup() override;
   virtual void plugin_shutdown() override;

   chain::database&  db();
   economy_api&      api();

   /// Directory of the store's shared memory file, resolved against the data dir
   const fc::path&   state_dir()const;

private:
   std::unique_ptr< detail::economy_plugin_impl > my;
};

} } } // lootbank::plugins::economy
