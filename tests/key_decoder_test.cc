/* Tests for key decoding.
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


#include "key_decoder.h"

#include <string>

#include <gtest/gtest.h>

#include "crypter_errors.h"

namespace price_crypter {
namespace {

TEST(KeyDecoderTest, DecodesHexInEitherCase) {
  EXPECT_EQ(std::string("\x00\x01\xab\xff", 4), DecodeKey("0001abff", KEY_DECODING_HEX));
  EXPECT_EQ(std::string("\x00\x01\xab\xff", 4), DecodeKey("0001ABFF", KEY_DECODING_HEX));
}

TEST(KeyDecoderTest, RejectsBadHex) {
  EXPECT_THROW(DecodeKey("", KEY_DECODING_HEX), KeyDecodeError);
  EXPECT_THROW(DecodeKey("abc", KEY_DECODING_HEX), KeyDecodeError);
  EXPECT_THROW(DecodeKey("zz", KEY_DECODING_HEX), KeyDecodeError);
  EXPECT_THROW(DecodeKey("ab:cd", KEY_DECODING_HEX), KeyDecodeError);
}

TEST(KeyDecoderTest, DecodesStandardBase64) {
  EXPECT_EQ(std::string("\x00\x01\x02", 3), DecodeKey("AAEC", KEY_DECODING_BASE64));
  EXPECT_EQ("hello", DecodeKey("aGVsbG8=", KEY_DECODING_BASE64));
  EXPECT_EQ(std::string("\xfb\xff", 2), DecodeKey("+/8=", KEY_DECODING_BASE64));
}

TEST(KeyDecoderTest, RejectsBadBase64) {
  EXPECT_THROW(DecodeKey("", KEY_DECODING_BASE64), KeyDecodeError);
  EXPECT_THROW(DecodeKey("aGVsbG8", KEY_DECODING_BASE64), KeyDecodeError);
  EXPECT_THROW(DecodeKey("a*b=", KEY_DECODING_BASE64), KeyDecodeError);
}

TEST(KeyDecoderTest, PlainKeepsBytes) {
  EXPECT_EQ("secret key", DecodeKey("secret key", KEY_DECODING_PLAIN));
  EXPECT_THROW(DecodeKey("", KEY_DECODING_PLAIN), KeyDecodeError);
}

TEST(KeyDecoderTest, ParsesModeNames) {
  EXPECT_EQ(KEY_DECODING_HEX, ParseKeyDecodingMode("hex"));
  EXPECT_EQ(KEY_DECODING_HEX, ParseKeyDecodingMode("HEX"));
  EXPECT_EQ(KEY_DECODING_BASE64, ParseKeyDecodingMode("Base64"));
  EXPECT_EQ(KEY_DECODING_PLAIN, ParseKeyDecodingMode("plain"));
  EXPECT_EQ(KEY_DECODING_PLAIN, ParseKeyDecodingMode("utf-8"));
  EXPECT_THROW(ParseKeyDecodingMode("rot13"), KeyDecodeError);
  EXPECT_STREQ("base64", KeyDecodingModeName(KEY_DECODING_BASE64));
}

}  // namespace
}  // namespace price_crypter
