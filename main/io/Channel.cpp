/**
 * Interface to an open source or sink of bytes.
 *
 *        File: Channel.cpp
 *
 *    Copyright 2021 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "config.h"

#include "Channel.h"

#include "error.h"

namespace chanio {

String Channel::Caps::to_string() const {
    return String("{readable=") + (readable ? "true" : "false") +
            ", writable=" + (writable ? "true" : "false") +
            ", seekable=" + (seekable ? "true" : "false") +
            ", selectable=" + (selectable ? "true" : "false") +
            ", descriptor=" + (descriptor ? "true" : "false") + "}";
}

Channel::Kind Channel::kindOf(const Caps& caps) noexcept {
    return caps.descriptor
            ? Kind::DESCRIPTOR
            : caps.seekable
              ? Kind::SEEKABLE
              : Kind::GENERIC;
}

Channel::~Channel() noexcept
{}

ssize_t Channel::read(ByteBuf& buf) {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't readable");
}

size_t Channel::write(ByteBuf& buf) {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't writable");
}

size_t Channel::write(ByteBuf& buf, const Offset pos) {
    throw LOGIC_ERROR("Channel " + to_string() + " doesn't support positional writes");
}

Offset Channel::getPosition() const {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't seekable");
}

void Channel::setPosition(const Offset pos) {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't seekable");
}

Offset Channel::getSize() const {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't seekable");
}

bool Channel::isBlocking() const {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't selectable");
}

void Channel::setBlocking(const bool block) {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't selectable");
}

Mutex& Channel::getBlockingLock() {
    throw LOGIC_ERROR("Channel " + to_string() + " isn't selectable");
}

Offset Channel::transferTo(
        const Offset pos,
        const Offset count,
        Channel&     dst) {
    throw LOGIC_ERROR("Channel " + to_string() + " can't transfer directly to another channel");
}

Offset Channel::transferFrom(
        Channel&     src,
        const Offset pos,
        const Offset count) {
    throw LOGIC_ERROR("Channel " + to_string() + " can't transfer directly from another channel");
}

String Channel::to_string() const {
    return "{caps=" + getCaps().to_string() + ", open=" + (isOpen() ? "true" : "false") + "}";
}

} // namespace
