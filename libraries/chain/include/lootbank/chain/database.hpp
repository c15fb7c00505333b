#pragma once

#include <lootbank/chain/user_object.hpp>
#include <lootbank/chain/catalog_objects.hpp>
#include <lootbank/chain/inventory_objects.hpp>

#include <lootbank/protocol/exceptions.hpp>

#include <fc/filesystem.hpp>

#include <boost/signals2/signal.hpp>

#include <functional>

namespace lootbank { namespace chain {

   /**
    *   @class database
    *   @brief tracks users, the item catalog, inventories and the opening history
    *
    *   Every multi-step mutation runs through with_transaction(), which holds the
    *   store's exclusive write lock and an undo session for its whole duration.
    *   If the callback throws, every write it made is rolled back.
    */
   class database : public chainbase::database
   {
      public:
         database();
         ~database();

         struct open_args
         {
            fc::path    shared_mem_dir;
            uint64_t    shared_file_size = LOOTBANK_DEFAULT_SHARED_FILE_SIZE_MB * 1024 * 1024;
            uint32_t    chainbase_flags = chainbase::database::read_write;
            uint64_t    lock_wait_micro = LOOTBANK_DEFAULT_LOCK_WAIT_MICRO;
            bool        do_validate_invariants = false;
         };

         /**
          * @brief Open a store, creating it when the directory is empty
          *
          * Undo state left behind by a process that stopped mid-transaction is
          * discarded.
          */
         void open( const open_args& args );

         void close();

         /// Closes the store and deletes its shared memory file
         void wipe( const fc::path& shared_mem_dir );

         /**
          * Runs callback under the write lock inside an undo session. The
          * session is committed when callback returns and undone when it
          * throws. Lock timeouts and shared memory exhaustion are reported as
          * store_unavailable_exception.
          */
         void with_transaction( const std::function< void() >& callback );

         /// Runs callback under the shared read lock
         void with_read_access( const std::function< void() >& callback );

         const user_object&   get_user( const user_id_type& id )const;
         const user_object*   find_user( const user_id_type& id )const;
         const user_object*   find_user_by_platform_id( platform_user_id_type platform_id )const;

         const item_object&   get_item( const item_id_type& id )const;
         const item_object*   find_item( const item_id_type& id )const;

         const case_object&   get_case( const case_id_type& id )const;
         const case_object*   find_case( const case_id_type& id )const;

         const inventory_entry_object& get_inventory_entry( const inventory_entry_id_type& id )const;
         const inventory_entry_object* find_inventory_entry( const inventory_entry_id_type& id )const;

         /** @name Catalog content
          *  Catalog rows are written by whoever provisions the store; the
          *  economy itself only reads them.
          */
         /// @{
         const item_object& create_item( const string& name, const string& description, rarity_type rarity,
                                         const share_type& price, const string& image_url = string() );
         const case_object& create_case( const string& name, const string& description,
                                         const share_type& price, const string& image_url = string() );
         const case_content_object& add_case_content( const case_object& c, const item_object& i, double weight );

         void set_item_active( const item_object& i, bool active );
         void set_case_active( const case_object& c, bool active );
         void set_case_content_active( const case_content_object& content, bool active );

         /// Removes a case with its contents and history; owned items keep living without a source case
         void remove_case( const case_object& c );
         /// Removes an item with its case placements, inventory entries and history
         void remove_item( const item_object& i );
         /// @}

         /**
          * Applies delta to the user's balance. A change that would leave the
          * balance negative throws insufficient_funds_exception.
          */
         void adjust_balance( const user_object& u, const share_type& delta );

         typedef std::function< void( const user_object&, const share_type& ) > balance_adjusted_handler_t;

         /// Handlers run inside the open transaction; a throwing handler aborts it
         boost::signals2::connection add_balance_adjusted_handler( const balance_adjusted_handler_t& func );

         void validate_invariants()const;

         uint64_t lock_wait_micro()const { return _lock_wait_micro; }

      private:
         void initialize_indexes();

         uint64_t                                                                 _lock_wait_micro = LOOTBANK_DEFAULT_LOCK_WAIT_MICRO;
         boost::signals2::signal< void( const user_object&, const share_type& ) > _balance_adjusted_signal;
   };

} } // lootbank::chain
