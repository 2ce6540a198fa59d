#include "test_common.h"

#include "sheetrun/digest.h"
#include "sheetrun/util.h"

#include <algorithm>
#include <filesystem>

using namespace sheetrun;

int main() {
    namespace fs = std::filesystem;

    // Test 1: known SHA-256 values, including the two-block padding case
    expect_eq_str(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "empty");
    expect_eq_str(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "abc");
    expect_eq_str(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
                  "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1", "56 bytes");

    // Test 2: feeding in uneven pieces gives the same digest
    {
        const std::string million(1000000, 'a');
        Sha256 h;
        size_t off = 0;
        size_t step = 1;
        while (off < million.size()) {
            size_t n = std::min(step, million.size() - off);
            h.update(reinterpret_cast<const uint8_t*>(million.data()) + off, n);
            off += n;
            step = step * 3 + 1;
        }
        expect_eq_str(h.hex_digest(), "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0",
                      "million a in pieces");
    }

    // Test 3: files
    {
        fs::path dir = fs::temp_directory_path() / "sheetrun_test_digest";
        std::error_code ec;
        fs::remove_all(dir, ec);
        std::string err = write_atomic_file(dir / "doc.csv", "abc");
        expect_true(err.empty(), "write: " + err);

        std::string hex;
        err = sha256_file(dir / "doc.csv", &hex);
        expect_true(err.empty(), "digest file: " + err);
        expect_eq_str(hex, sha256_hex("abc"), "file digest matches contents");
        expect_true(!sha256_file(dir / "missing.csv", &hex).empty(), "missing file is an error");
        fs::remove_all(dir, ec);
    }

    std::cerr << "test_digest: ALL PASSED" << std::endl;
    return 0;
}
