/* Diagnostic tracing of the encryption steps.
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

#include <iomanip>
#include <iostream>
#include <sstream>

namespace price_crypter {

StreamTracer::StreamTracer() : out_(&std::cerr) {}

StreamTracer::StreamTracer(std::ostream* out) : out_(out) {}

void StreamTracer::Trace(const std::string& event, const std::string& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ios_base::iostate saved = out_->exceptions();
  out_->exceptions(std::ios_base::goodbit);
  *out_ << "[price_crypter] " << event << " : " << value << "\n";
  out_->flush();
  out_->clear();
  out_->exceptions(saved);
}

std::string HexEncode(const unsigned char* data, size_t len) {
  std::ostringstream oss;
  for (size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string HexEncode(const std::string& data) {
  return HexEncode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

}  // namespace price_crypter
