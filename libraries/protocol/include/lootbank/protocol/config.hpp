#pragma once

#define LOOTBANK_100_PERCENT                     10000
#define LOOTBANK_1_PERCENT                       (LOOTBANK_100_PERCENT/100)

/// Fraction of an item's base price paid back when it is sold, in basis points
#define LOOTBANK_DEFAULT_SELL_RATIO              (70*LOOTBANK_1_PERCENT)
#define LOOTBANK_DEFAULT_STARTING_BALANCE        (int64_t(1000))

#define LOOTBANK_INIT_DATA_HASH_FIELD            "hash"
#define LOOTBANK_INIT_DATA_USER_FIELD            "user"
#define LOOTBANK_INIT_DATA_AUTH_DATE_FIELD       "auth_date"
#define LOOTBANK_MAX_INIT_DATA_LENGTH            4096

#define LOOTBANK_MAX_NAME_LENGTH                 256
#define LOOTBANK_MAX_DESCRIPTION_LENGTH          4096
#define LOOTBANK_MAX_URL_LENGTH                  2048

#define LOOTBANK_DEFAULT_LOCK_WAIT_MICRO         (uint64_t(1000000))
#define LOOTBANK_DEFAULT_SHARED_FILE_SIZE_MB     (uint64_t(256))
