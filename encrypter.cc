/* Command-line tool to encrypt and decrypt 64-bit prices.
 * Based on
 * 		https://code.google.com/p/privatedatacommunicationprotocol/
 * 		https://code.google.com/p/privatedatacommunicationprotocol/downloads/detail?name=64bitdecrypter-v1.0.1.tgz
 * 
 *  
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

#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <iostream>
#include <sstream>
#include <string>

#include "price_crypter.h"

using namespace std;
using namespace price_crypter;

// Encryption and integrity keys from https://code.google.com/p/privatedatacommunicationprotocol/
const char kEncryptionKey[] =
    "b08c70cfbcb0eb6cab7e82c6b75da52072ae62b2bf4b990bb80a48d8141eec07";
const char kIntegrityKey[] =
    "bf77ec55c30130c1d8cd1862ed2a4cd2c76ac33bc0c4ce8a3d3bbd3ad5687792";
const double kDefaultScaleFactor = 1000000;

static string GetEnv(const char* name, const string& fallback) {
  const char* value = getenv(name);
  return (value != NULL && *value != '\0') ? string(value) : fallback;
}

static void Usage(const char* prog) {
  cerr << "Usage: " << prog << " [--debug] encrypt price [seed]" << endl;
  cerr << "       " << prog << " [--debug] decrypt token" << endl;
  cerr << endl;
  cerr << "Environment: PRICE_ENCRYPTION_KEY, PRICE_INTEGRITY_KEY," << endl;
  cerr << "             PRICE_KEY_DECODING (hex|base64|plain), PRICE_SCALE_FACTOR" << endl;
}

static bool ParseDouble(const string& text, double* value) {
  char* end = NULL;
  *value = strtod(text.c_str(), &end);
  return !text.empty() && end != NULL && *end == '\0';
}

// Seed from the current time, as sec.usec.
static string TimeSeed() {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  ostringstream oss;
  oss << tv.tv_sec << "." << tv.tv_usec;
  return oss.str();
}

int main(int argc, char* argv[]) {
  bool debug = false;
  int arg = 1;
  if (arg < argc && strcmp(argv[arg], "--debug") == 0) {
    debug = true;
    arg++;
  }
  if (argc - arg < 2) {
    Usage(argv[0]);
    return 1;
  }
  string command = argv[arg];

  double scale_factor = kDefaultScaleFactor;
  string scale_text = GetEnv("PRICE_SCALE_FACTOR", "");
  if (!scale_text.empty() && !ParseDouble(scale_text, &scale_factor)) {
    cerr << "Error: invalid PRICE_SCALE_FACTOR: " << scale_text << endl;
    return 1;
  }

  StreamTracer tracer;
  try {
    KeyDecodingMode mode = ParseKeyDecodingMode(GetEnv("PRICE_KEY_DECODING", "hex"));
    PriceCrypter crypter = NewCodec(GetEnv("PRICE_ENCRYPTION_KEY", kEncryptionKey),
                                    GetEnv("PRICE_INTEGRITY_KEY", kIntegrityKey),
                                    mode, scale_factor, debug, &tracer);

    if (command == "encrypt" && argc - arg <= 3) {
      double price = 0;
      if (!ParseDouble(argv[arg + 1], &price)) {
        cerr << "Error: invalid price: " << argv[arg + 1] << endl;
        return 1;
      }
      string seed = (argc - arg == 3) ? string(argv[arg + 2]) : TimeSeed();
      string price_enc = crypter.Encrypt(seed, price, debug);

      cout << "Price (raw):\t\t" << price << endl;
      cout << "Price (encrypted):\t" << price_enc << endl;
    } else if (command == "decrypt" && argc - arg == 2) {
      double price = crypter.Decrypt(argv[arg + 1], debug);

      cout << "Price (encrypted):\t" << argv[arg + 1] << endl;
      cout << "Price (raw):\t\t" << price << endl;
    } else {
      Usage(argv[0]);
      return 1;
    }
  } catch (const PriceCrypterError& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }
  return 0;
}
