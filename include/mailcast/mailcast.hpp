#pragma once

#include <mailcast/config.hpp>
#include <mailcast/detail/log.hpp>
#include <mailcast/detail/result.hpp>

#include <mailcast/codec/base64.hpp>
#include <mailcast/codec/charset.hpp>
#include <mailcast/codec/codec.hpp>
#include <mailcast/codec/q_codec.hpp>
#include <mailcast/codec/quoted_printable.hpp>

#include <mailcast/mime/content_selector.hpp>
#include <mailcast/mime/message.hpp>
#include <mailcast/mime/metadata.hpp>
#include <mailcast/mime/mime.hpp>

#include <mailcast/text/cleaner.hpp>
#include <mailcast/text/footnotes.hpp>
#include <mailcast/text/markup.hpp>
#include <mailcast/text/normalizer.hpp>

#include <mailcast/processor.hpp>

// Per newsletter rules
#include <mailcast/sources/source_adapter.hpp>
