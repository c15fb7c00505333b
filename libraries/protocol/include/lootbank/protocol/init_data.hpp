#pragma once

#include <lootbank/protocol/types.hpp>

#include <fc/crypto/sha256.hpp>

namespace lootbank { namespace protocol {

typedef vector< pair< string, string > > init_data_fields;

/**
 * Splits a query-string style payload ("k1=v1&k2=v2") into key/value pairs,
 * each segment split on its first '='. Values are kept as received.
 *
 * @return false when a segment is empty, has no '=', has an empty key or
 *         repeats a key seen earlier
 */
bool parse_init_data( const string& payload, init_data_fields& fields );

/**
 * Sorts the fields by key and joins them as "key=value" lines separated
 * by '\n'. The hash field must already be removed.
 */
string build_check_string( init_data_fields fields );

/// Percent-decodes a query-string value, '+' decoding to a space
bool url_decode( const string& in, string& out );

/**
 * Authenticates identity payloads signed by the messaging platform.
 *
 * The shared secret is the SHA-256 digest of the bot credential. A payload is
 * authentic when the lowercase hex HMAC-SHA256 of its check string equals the
 * value of its "hash" field. Comparison runs in constant time.
 */
class init_data_verifier
{
   public:
      explicit init_data_verifier( const string& bot_token );

      /// Never throws; every malformed or forged payload yields false
      bool verify( const string& payload )const;

      /// Lowercase hex HMAC of a check string under this verifier's secret
      string sign( const string& check_string )const;

   private:
      fc::sha256 _secret;
};

/**
 * Reads the identity carried by the "user" field (percent-encoded JSON) and
 * the optional "auth_date" field. Does not authenticate; call
 * init_data_verifier::verify first.
 */
optional< platform_identity > extract_identity( const string& payload );

} } // lootbank::protocol
