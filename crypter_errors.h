/* Exceptions thrown by the price crypter.
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


#ifndef PRICE_CRYPTER_CRYPTER_ERRORS_H_
#define PRICE_CRYPTER_CRYPTER_ERRORS_H_

#include <stdexcept>
#include <string>

namespace price_crypter {

// Base of every error the library throws.
class PriceCrypterError : public std::runtime_error {
 public:
  explicit PriceCrypterError(const std::string& what)
      : std::runtime_error(what) {}
};

// A raw key string could not be decoded under the configured mode.
class KeyDecodeError : public PriceCrypterError {
 public:
  explicit KeyDecodeError(const std::string& what)
      : PriceCrypterError(what) {}
};

// The scale factor is not strictly positive.
class ScaleFactorError : public PriceCrypterError {
 public:
  explicit ScaleFactorError(const std::string& what)
      : PriceCrypterError(what) {}
};

// The price is negative, not a number, or does not fit in 8 bytes once scaled.
class PriceRangeError : public PriceCrypterError {
 public:
  explicit PriceRangeError(const std::string& what)
      : PriceCrypterError(what) {}
};

// The token is not websafe base64 or does not decode to 28 bytes.
class MalformedTokenError : public PriceCrypterError {
 public:
  explicit MalformedTokenError(const std::string& what)
      : PriceCrypterError(what) {}
};

// The recomputed signature differs from the one carried by the token.
class IntegrityError : public PriceCrypterError {
 public:
  explicit IntegrityError(const std::string& what)
      : PriceCrypterError(what) {}
};

// libcrypto reported a failure.
class CryptoError : public PriceCrypterError {
 public:
  explicit CryptoError(const std::string& what)
      : PriceCrypterError(what) {}
};

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_CRYPTER_ERRORS_H_
