#include "SHA256.h"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace QuietSync;

void test_string_hash() {
    std::cout << "Running test_string_hash..." << std::endl;

    // "hello" -> "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824"
    std::string expected = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
    assert(SHA256::hash("hello") == expected);

    // "" -> "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
    std::string emptyExpected = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    assert(SHA256::hash("") == emptyExpected);

    std::cout << "test_string_hash passed." << std::endl;
}

void test_bytes_hash() {
    std::cout << "Running test_bytes_hash..." << std::endl;

    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    std::string expected = "039058c6f2c0cb492c533b0a4d14ef77cc0f78abccced5287d84a1a2011cfb81";
    assert(SHA256::hashBytes(data) == expected);

    std::cout << "test_bytes_hash passed." << std::endl;
}

void test_incremental_context() {
    std::cout << "Running test_incremental_context..." << std::endl;

    SHA256::Context ctx;
    assert(ctx.valid());
    assert(ctx.update("he", 2));
    assert(ctx.update("", 0));
    assert(ctx.update("llo", 3));
    assert(ctx.finalHex() == SHA256::hash("hello"));

    // Finished contexts refuse further input
    assert(!ctx.valid());
    assert(!ctx.update("x", 1));
    assert(ctx.finalHex().empty());

    std::cout << "test_incremental_context passed." << std::endl;
}

void test_file_hash() {
    std::cout << "Running test_file_hash..." << std::endl;

    std::string path = "test_sha256_input.bin";
    std::string content(200000, '\0');
    for (size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>(i * 31 + 7);
    }
    {
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
    }

    assert(SHA256::hashFile(path) == SHA256::hash(content));
    assert(SHA256::hashFile("no_such_file.bin").empty());

    std::filesystem::remove(path);
    std::cout << "test_file_hash passed." << std::endl;
}

int main() {
    try {
        test_string_hash();
        test_bytes_hash();
        test_incremental_context();
        test_file_hash();
        std::cout << "All SHA256 tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
