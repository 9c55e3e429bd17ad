/* Tests for diagnostic tracing.
 *
 *	Licensed under the Apache License, Version 2.0 (the "License");
 *	you may not use this file except in compliance with the License.
 *	You may obtain a copy of the License at
 *
 *		http://www.apache.org/licenses/LICENSE-2.0
 *
 *	Unless required by applicable law or agreed to in writing, software
 *	distributed under the License is distributed on an "AS IS" BASIS,
 *	WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *	See the License for the specific language governing permissions and
 *	limitations under the License.
*/


#include "price_tracer.h"

#include <ostream>
#include <sstream>
#include <streambuf>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "price_crypter.h"

namespace price_crypter {
namespace {

const char kEncryptionKeyHex[] =
    "b08c70cfbcb0eb6cab7e82c6b75da52072ae62b2bf4b990bb80a48d8141eec07";
const char kIntegrityKeyHex[] =
    "bf77ec55c30130c1d8cd1862ed2a4cd2c76ac33bc0c4ce8a3d3bbd3ad5687792";

class RecordingTracer : public PriceTracer {
 public:
  virtual void Trace(const std::string& event, const std::string& value) {
    events.push_back(std::make_pair(event, value));
  }

  bool Has(const std::string& event) const {
    for (size_t i = 0; i < events.size(); ++i) {
      if (events[i].first == event) return true;
    }
    return false;
  }

  std::vector<std::pair<std::string, std::string> > events;
};

class ThrowingTracer : public PriceTracer {
 public:
  virtual void Trace(const std::string&, const std::string&) {
    throw std::runtime_error("log sink is gone");
  }
};

TEST(HexEncodeTest, Lowercase) {
  EXPECT_EQ("00ff10ab", HexEncode(std::string("\x00\xff\x10\xab", 4)));
  EXPECT_EQ("", HexEncode(std::string()));
}

TEST(StreamTracerTest, WritesOneLinePerEvent) {
  std::ostringstream out;
  StreamTracer tracer(&out);
  tracer.Trace("Pad", "0102");
  tracer.Trace("Signature", "abcd");
  EXPECT_EQ("[price_crypter] Pad : 0102\n[price_crypter] Signature : abcd\n", out.str());
}

// Every write fails.
class FailingBuf : public std::streambuf {
 protected:
  virtual int_type overflow(int_type) { return traits_type::eof(); }
};

TEST(StreamTracerTest, DoesNotThrowOnFailedStream) {
  FailingBuf buf;
  std::ostream out(&buf);
  out.exceptions(std::ios_base::badbit);
  StreamTracer tracer(&out);
  EXPECT_NO_THROW(tracer.Trace("Pad", "0102"));
  EXPECT_TRUE(out.good());
}

TEST(PriceCrypterTracingTest, SilentUnlessDebug) {
  RecordingTracer tracer;
  PriceCrypter crypter = NewCodec(kEncryptionKeyHex, kIntegrityKeyHex, KEY_DECODING_HEX,
                                  1000000, false, &tracer);
  crypter.Decrypt(crypter.Encrypt("auction-123", 1.5, false), false);
  EXPECT_TRUE(tracer.events.empty());
}

TEST(PriceCrypterTracingTest, PerCallDebugTracesSteps) {
  RecordingTracer tracer;
  PriceCrypter crypter = NewCodec(kEncryptionKeyHex, kIntegrityKeyHex, KEY_DECODING_HEX,
                                  1000000, false, &tracer);
  std::string token = crypter.Encrypt("auction-123", 1.5, true);
  EXPECT_TRUE(tracer.Has("Keys decoding mode"));
  EXPECT_TRUE(tracer.Has("Encryption key (bytes)"));
  EXPECT_TRUE(tracer.Has("Initialization vector"));
  EXPECT_TRUE(tracer.Has("Pad"));
  EXPECT_TRUE(tracer.Has("Encoded price"));
  EXPECT_TRUE(tracer.Has("Signature"));

  tracer.events.clear();
  crypter.Decrypt(token, true);
  EXPECT_TRUE(tracer.Has("Pad"));
  EXPECT_TRUE(tracer.Has("Price"));
}

TEST(PriceCrypterTracingTest, CodecDebugTracesEveryCall) {
  RecordingTracer tracer;
  PriceCrypter crypter = NewCodec(kEncryptionKeyHex, kIntegrityKeyHex, KEY_DECODING_HEX,
                                  1000000, true, &tracer);
  crypter.Encrypt("auction-123", 1.5, false);
  EXPECT_TRUE(tracer.Has("Seed"));
}

TEST(PriceCrypterTracingTest, TracerFailureDoesNotChangeResult) {
  ThrowingTracer tracer;
  PriceCrypter traced = NewCodec(kEncryptionKeyHex, kIntegrityKeyHex, KEY_DECODING_HEX,
                                 1000000, true, &tracer);
  PriceCrypter quiet = NewCodec(kEncryptionKeyHex, kIntegrityKeyHex, KEY_DECODING_HEX,
                                1000000, false);
  std::string token = traced.Encrypt("auction-123", 1.5, true);
  EXPECT_EQ(quiet.Encrypt("auction-123", 1.5, false), token);
  EXPECT_DOUBLE_EQ(1.5, traced.Decrypt(token, true));
}

}  // namespace
}  // namespace price_crypter
