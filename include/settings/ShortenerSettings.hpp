#pragma once

#include <string>
#include <cstdlib>
#include <cstddef>
#include <chrono>
#include <set>
#include <stdexcept>

namespace shortener::settings {

/**
 * @brief Настройки генерации кодов и HTTP-границы
 *
 * Значения по умолчанию: алфавит из 62 символов, длина 6
 * (около 56.8 млрд кодов), лимит попыток 256.
 */
class ShortenerSettings {
public:
    /// Совпадает с links.code VARCHAR(32)
    static constexpr std::size_t MAX_CODE_LENGTH = 32;

    static constexpr const char* DEFAULT_ALPHABET =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

    /**
     * @brief Настройки из переменных окружения
     */
    ShortenerSettings()
        : ShortenerSettings(
              getEnvOrDefault("SHORTENER_CODE_ALPHABET", DEFAULT_ALPHABET),
              positiveFromEnv("SHORTENER_CODE_LENGTH", 6),
              positiveFromEnv("SHORTENER_MAX_ATTEMPTS", 256))
    {
        storage_ = getEnvOrDefault("SHORTENER_STORAGE", "postgres");

        long long timeoutMs = integerFromEnv("SHORTENER_REQUEST_TIMEOUT_MS", 2000);
        if (timeoutMs < 0) {
            throw std::invalid_argument("SHORTENER_REQUEST_TIMEOUT_MS must not be negative, got: "
                                        + std::to_string(timeoutMs));
        }
        requestTimeout_ = std::chrono::milliseconds(timeoutMs);
        baseUrl_ = getEnvOrDefault("SHORTENER_BASE_URL", "http://localhost:8080");

        if (storage_ != "postgres" && storage_ != "memory") {
            throw std::invalid_argument("SHORTENER_STORAGE must be 'postgres' or 'memory', got: " + storage_);
        }
        while (!baseUrl_.empty() && baseUrl_.back() == '/') {
            baseUrl_.pop_back();
        }
    }

    /**
     * @brief Явные параметры генерации (для тестов и встраивания)
     */
    ShortenerSettings(std::string alphabet, std::size_t codeLength, std::size_t maxAttempts)
        : alphabet_(std::move(alphabet))
        , codeLength_(codeLength)
        , maxAttempts_(maxAttempts)
    {
        validate();
    }

    const std::string& getAlphabet() const { return alphabet_; }
    std::size_t getCodeLength() const { return codeLength_; }
    std::size_t getMaxAttempts() const { return maxAttempts_; }
    const std::string& getStorage() const { return storage_; }
    std::chrono::milliseconds getRequestTimeout() const { return requestTimeout_; }
    const std::string& getBaseUrl() const { return baseUrl_; }

private:
    std::string alphabet_;
    std::size_t codeLength_;
    std::size_t maxAttempts_;
    std::string storage_ = "memory";
    std::chrono::milliseconds requestTimeout_{0};
    std::string baseUrl_ = "http://localhost:8080";

    void validate() const {
        if (alphabet_.empty()) {
            throw std::invalid_argument("Code alphabet must not be empty");
        }
        if (std::set<char>(alphabet_.begin(), alphabet_.end()).size() != alphabet_.size()) {
            throw std::invalid_argument("Code alphabet must not contain duplicate symbols");
        }
        if (codeLength_ == 0) {
            throw std::invalid_argument("Code length must be positive");
        }
        if (codeLength_ > MAX_CODE_LENGTH) {
            throw std::invalid_argument("Code length must not exceed " + std::to_string(MAX_CODE_LENGTH)
                                        + ", got: " + std::to_string(codeLength_));
        }
        if (maxAttempts_ == 0) {
            throw std::invalid_argument("Max attempts must be positive");
        }
    }

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    /// Целое со знаком целиком; "12abc" и пустая строка - ошибка
    static long long integerFromEnv(const char* name, long long defaultValue) {
        std::string raw = getEnvOrDefault(name, std::to_string(defaultValue));
        try {
            std::size_t pos = 0;
            long long value = std::stoll(raw, &pos);
            if (pos == raw.size()) {
                return value;
            }
        } catch (const std::logic_error&) {
            // invalid_argument или out_of_range: сообщение ниже
        }
        throw std::invalid_argument(std::string(name) + " must be an integer, got: '" + raw + "'");
    }

    static std::size_t positiveFromEnv(const char* name, long long defaultValue) {
        long long value = integerFromEnv(name, defaultValue);
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive, got: " + std::to_string(value));
        }
        return static_cast<std::size_t>(value);
    }
};

} // namespace shortener::settings
