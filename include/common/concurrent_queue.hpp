#pragma once

#include <mutex>
#include <queue>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 批量评测时所有任务在 worker 启动前一次性入队，worker 通过 try_pop 拉取，
 * 队列为空即表示没有剩余任务。
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(value);
    }

    std::size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    std::mutex mut;
};

}  // namespace grader
