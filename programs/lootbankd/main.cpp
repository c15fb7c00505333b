#include <lootbank/plugins/economy/economy_plugin.hpp>

#include <appbase/application.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <boost/exception/diagnostic_information.hpp>

#include <iostream>

int main( int argc, char** argv )
{
   try
   {
      appbase::app().register_plugin< lootbank::plugins::economy::economy_plugin >();

      if( !appbase::app().initialize< lootbank::plugins::economy::economy_plugin >( argc, argv ) )
         return 0;

      ilog( "lootbankd started" );

      appbase::app().startup();
      appbase::app().exec();
      std::cout << "exited cleanly\n";
      return 0;
   }
   catch ( const boost::exception& e )
   {
      std::cerr << boost::diagnostic_information( e ) << "\n";
   }
   catch ( const fc::exception& e )
   {
      std::cerr << e.to_detail_string() << "\n";
   }
   catch ( const std::exception& e )
   {
      std::cerr << e.what() << "\n";
   }
   catch ( ... )
   {
      std::cerr << "unknown exception\n";
   }

   return -1;
}
