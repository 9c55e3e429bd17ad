/* Tests for the base64 helpers.
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


#include "websafe_base64.h"

#include <string>

#include <gtest/gtest.h>

#include "crypter_errors.h"

namespace price_crypter {
namespace {

TEST(WebSafeBase64Test, UsesUrlSafeAlphabetAndEqualsPadding) {
  EXPECT_EQ("-_8=", WebSafeBase64Encode(std::string("\xfb\xff", 2)));
  EXPECT_EQ("aGVsbG8=", WebSafeBase64Encode("hello"));
  EXPECT_EQ("YQ==", WebSafeBase64Encode("a"));
}

TEST(WebSafeBase64Test, AddsPadding) {
  EXPECT_EQ("abcd", AddBase64Padding("abcd"));
  EXPECT_EQ("abc=", AddBase64Padding("abc"));
  EXPECT_EQ("ab==", AddBase64Padding("ab"));
}

TEST(WebSafeBase64Test, DecodesWithOrWithoutPadding) {
  EXPECT_EQ(std::string("\xfb\xff", 2), WebSafeBase64Decode("-_8="));
  EXPECT_EQ(std::string("\xfb\xff", 2), WebSafeBase64Decode("-_8"));
  EXPECT_EQ("a", WebSafeBase64Decode("YQ"));
}

TEST(WebSafeBase64Test, RejectsInvalidText) {
  EXPECT_THROW(WebSafeBase64Decode(""), MalformedTokenError);
  EXPECT_THROW(WebSafeBase64Decode("+/8="), MalformedTokenError);
  EXPECT_THROW(WebSafeBase64Decode("YQ.."), MalformedTokenError);
  EXPECT_THROW(WebSafeBase64Decode("Y Q="), MalformedTokenError);
}

TEST(WebSafeBase64Test, RejectsNonZeroTrailingBits) {
  EXPECT_THROW(WebSafeBase64Decode("YR=="), MalformedTokenError);
  EXPECT_THROW(WebSafeBase64Decode("YR"), MalformedTokenError);
  EXPECT_THROW(WebSafeBase64Decode("-_9="), MalformedTokenError);
  EXPECT_EQ("a", WebSafeBase64Decode("YQ=="));
}

TEST(StandardBase64Test, Decodes) {
  std::string out;
  EXPECT_TRUE(StandardBase64Decode("+/8=", &out));
  EXPECT_EQ(std::string("\xfb\xff", 2), out);
  EXPECT_FALSE(StandardBase64Decode("-_8=", &out));
  EXPECT_FALSE(StandardBase64Decode("abc", &out));
}

}  // namespace
}  // namespace price_crypter
