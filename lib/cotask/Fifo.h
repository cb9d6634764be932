/*
 * MIT License
 * 
 * Copyright (c) 2022 Robin E. R. Davies
 * 
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 * 
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 * 
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <vector>
#include <stdexcept>
#include <utility>

namespace cotask
{
    /**
     * @brief Growable ring buffer.
     *
     * Not thread-safe. Callers provide their own locking.
     */
    template <typename T>
    class Fifo
    {
    public:
        Fifo(size_t initialCapacity = 64);
        void push(const T &value);
        void push(T &&value);
        T pop();
        size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }
        size_t capacity() const { return storage.size(); }
        void clear();

    private:
        void grow();

        size_t head_ = 0;
        size_t tail_ = 0;
        size_t size_ = 0;
        std::vector<T> storage;
    };

    /*****/
    template <typename T>
    Fifo<T>::Fifo(size_t initialCapacity)
    {
        storage.resize(initialCapacity == 0 ? 1 : initialCapacity);
    }

    template <typename T>
    void Fifo<T>::push(const T &value)
    {
        T copy{value};
        push(std::move(copy));
    }

    template <typename T>
    void Fifo<T>::push(T &&value)
    {
        if (size_ == storage.size())
        {
            grow();
        }
        storage[tail_] = std::move(value);
        if (++tail_ == storage.size())
        {
            tail_ = 0;
        }
        ++size_;
    }

    template <typename T>
    T Fifo<T>::pop()
    {
        if (size_ == 0)
            throw std::out_of_range("Fifo is empty.");
        T result = std::move(storage[head_]);
        if (++head_ == storage.size())
            head_ = 0;
        --size_;
        return result;
    }

    template <typename T>
    void Fifo<T>::clear()
    {
        while (size_ != 0)
        {
            pop();
        }
        head_ = tail_ = 0;
    }

    template <typename T>
    void Fifo<T>::grow()
    {
        std::vector<T> newStorage;
        newStorage.resize(storage.size() * 2);
        size_t n = size_;
        for (size_t i = 0; i < n; ++i)
        {
            newStorage[i] = pop();
        }
        storage = std::move(newStorage);
        head_ = 0;
        tail_ = n;
        size_ = n;
    }
} // namespace
