#pragma once

#include <postino/config.hpp>
#include <postino/export.hpp>

#include <postino/detail/log.hpp>
#include <postino/detail/result.hpp>

#include <postino/codec/base64.hpp>
#include <postino/codec/codec.hpp>
#include <postino/codec/encoded_word.hpp>

#include <postino/mime/address.hpp>
#include <postino/mime/date_time.hpp>
#include <postino/mime/framer.hpp>
#include <postino/mime/headers.hpp>
#include <postino/mime/message.hpp>

#include <postino/storage/mailbox.hpp>

#if POSTINO_THROWING_ENABLED
#include <postino/throwing.hpp>
#endif
