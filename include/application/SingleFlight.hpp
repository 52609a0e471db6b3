#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tiercache::application {

/**
 * @brief Не более одного выполнения на ключ среди одновременных вызовов
 *
 * Первый вызвавший для ключа становится лидером и выполняет функцию,
 * остальные (ведомые) ждут его результата. Все получают одни и те же
 * байты и один и тот же признак происхождения, либо одно и то же
 * исключение.
 *
 * Мьютекс держится только на "вставить или присоединиться" и на
 * удалении группы; сама функция выполняется без блокировки, поэтому
 * медленный ключ не тормозит остальные.
 *
 * Ведомый ждёт до конца, отмена его собственного контекста
 * ожидание не прерывает.
 */
class SingleFlight {
public:
    struct Result {
        std::string bytes;
        bool cached = false;  ///< Байты взяты из кэша, а не вычислены сейчас
    };

    using Fn = std::function<Result()>;

    /**
     * @brief Выполнить fn для key или присоединиться к выполняющемуся
     * @throws то же исключение, что бросила fn лидера
     */
    Result run(const std::string& key, const Fn& fn);

    /**
     * @brief Количество ключей, для которых сейчас идёт вычисление
     */
    std::size_t inFlight() const;

    /**
     * @brief Сколько вызовов присоединилось к текущей группе ключа (лидер + ведомые)
     *
     * Счётчик только растёт, пока группа жива; новая группа начинает с 1.
     * 0 если группы для ключа нет.
     */
    std::size_t joined(const std::string& key) const;

private:
    struct Call {
        std::shared_future<Result> result;
        std::size_t joined = 1;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Call>> calls_;
};

} // namespace tiercache::application
