/**
 * @file Client.cpp
 *
 * This module contains the implementation of the Huddle::Client class.
 *
 * © 2020 by Richard Walters
 */

#include <AsyncData/MultiProducerSingleConsumerQueue.hpp>
#include <chrono>
#include <condition_variable>
#include <future>
#include <Huddle/Client.hpp>
#include <Huddle/NetworkTransport.hpp>
#include <map>
#include <mutex>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <thread>

namespace {

    /**
     * This is the default time, in seconds, that Connect waits for the
     * server to reply to the join.
     */
    constexpr double DEFAULT_CONNECT_TIMEOUT = 10.0;

}

namespace Huddle {

    /**
     * This contains the private properties of a Client class instance.
     */
    struct Client::Impl
        : std::enable_shared_from_this< Impl >
    {
        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to synchronize access to the properties below.
         */
        std::recursive_mutex mutex;

        /**
         * This is the function used to open a connection with the
         * membership server.
         */
        TransportFactory transportFactory;

        /**
         * This is the transport of the current (or last) connection with
         * the server.
         */
        std::unique_ptr< ITransport > transport;

        /**
         * This is incremented for each connection attempt, and when
         * leaving, so that callbacks from older connections are ignored.
         */
        size_t generation = 0;

        /**
         * This is the identifier under which the client joined.
         */
        std::string id;

        bool connected = false;
        bool isCoordinator = false;
        std::string coordinatorId;

        double connectTimeout = DEFAULT_CONNECT_TIMEOUT;

        /**
         * While Connect waits for the server's reply to the join, this
         * is used to hand the reply over.
         */
        std::shared_ptr< std::promise< Message > > firstReply;

        /**
         * This is the next identifier to use for an event subscription.
         */
        int nextEventSubscriberId = 0;

        /**
         * These are the current subscriptions to client events.
         */
        std::map< int, EventDelegate > eventSubscribers;

        /**
         * This holds events to be published by the client in its worker
         * thread.
         */
        AsyncData::MultiProducerSingleConsumerQueue<
            std::shared_ptr< Event >
        > eventQueue;

        /**
         * This thread publishes any events in the event queue.
         */
        std::thread eventQueueWorker;

        /**
         * This is used to signal the event queue worker thread to wake up
         * and when the event queue worker thread should stop.
         */
        std::condition_variable eventQueueWorkerWakeCondition;

        /**
         * This is used to synchronize access to the event queue worker thread.
         */
        std::mutex eventQueueMutex;

        /**
         * This indicates whether or not the event queue worker thread should
         * stop.
         */
        bool stopEventQueueWorker = false;

        // Methods

        Impl()
            : diagnosticsSender("Huddle::Client")
        {
        }

        /**
         * Queue the given event to be published by the worker thread.
         *
         * @param[in] event
         *     This is the event to publish.
         */
        void AddToEventQueue(std::shared_ptr< Event >&& event) {
            std::lock_guard< decltype(eventQueueMutex) > lock(eventQueueMutex);
            eventQueue.Add(std::move(event));
            eventQueueWorkerWakeCondition.notify_one();
        }

        /**
         * Queue an event publishing the given message.
         *
         * @param[in] message
         *     This is the message to publish.
         */
        void PublishMessage(const Message& message) {
            const auto event = std::make_shared< MessageReceivedEvent >();
            event->message = message;
            AddToEventQueue(event);
        }

        /**
         * Publish every event in the event queue.
         *
         * @param[in,out] lock
         *     This is the lock held on the event queue mutex, released
         *     while the subscribers are called.
         */
        void ProcessEventQueue(
            std::unique_lock< decltype(eventQueueMutex) >& lock
        ) {
            lock.unlock();
            decltype(eventSubscribers) eventSubscribersSample;
            {
                std::lock_guard< decltype(mutex) > subscribersLock(mutex);
                eventSubscribersSample = eventSubscribers;
            }
            while (!eventQueue.IsEmpty()) {
                const auto event = eventQueue.Remove();
                for (auto eventSubscriber: eventSubscribersSample) {
                    eventSubscriber.second(*event);
                }
            }
            lock.lock();
        }

        /**
         * This is the body of the thread which publishes events.
         */
        void EventQueueWorker() {
            std::unique_lock< decltype(eventQueueMutex) > lock(eventQueueMutex);
            diagnosticsSender.SendDiagnosticInformationString(
                0,
                "Event queue worker thread started"
            );
            while (!stopEventQueueWorker) {
                eventQueueWorkerWakeCondition.wait(
                    lock,
                    [this]{
                        return (
                            stopEventQueueWorker
                            || !eventQueue.IsEmpty()
                        );
                    }
                );
                ProcessEventQueue(lock);
            }
            diagnosticsSender.SendDiagnosticInformationString(
                0,
                "Event queue worker thread stopping"
            );
        }

        /**
         * Handle a message received from the server.
         *
         * @param[in] thisGeneration
         *     This is the generation of the connection over which the
         *     message arrived.
         *
         * @param[in] message
         *     This is the message received.
         */
        void OnMessage(
            size_t thisGeneration,
            Message&& message
        ) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (generation != thisGeneration) {
                return;
            }
            if (firstReply != nullptr) {
                const auto firstReplySample = firstReply;
                firstReply = nullptr;
                if (message.type == Message::Type::Join) {
                    connected = true;
                    isCoordinator = message.isCoordinator;
                    coordinatorId = message.coordinatorId;
                    PublishMessage(message);
                }
                firstReplySample->set_value(std::move(message));
                return;
            }
            if (!connected) {
                return;
            }
            switch (message.type) {
                case Message::Type::Heartbeat:
                case Message::Type::Broadcast:
                case Message::Type::Private:
                case Message::Type::RequestMemberListApproval:
                case Message::Type::MemberListDenied:
                case Message::Type::MemberNameList:
                case Message::Type::Error: {
                    PublishMessage(message);
                } break;

                case Message::Type::MemberList: {
                    const auto event = std::make_shared< MembershipChangedEvent >();
                    event->members = message.GetMembers();
                    AddToEventQueue(event);
                } break;

                case Message::Type::Join: {
                    isCoordinator = message.isCoordinator;
                    if (!message.coordinatorId.empty()) {
                        coordinatorId = message.coordinatorId;
                    }
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        3,
                        "Coordinator is now %s",
                        coordinatorId.c_str()
                    );
                    PublishMessage(message);
                } break;

                case Message::Type::Leave: {
                    diagnosticsSender.SendDiagnosticInformationString(
                        2,
                        "Leave acknowledged"
                    );
                } break;

                case Message::Type::Unknown: {
                    diagnosticsSender.SendDiagnosticInformationString(
                        SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                        "Malformed message from server; disconnecting"
                    );
                    transport->Close(false);
                    LoseConnection();
                } break;

                default: {
                    diagnosticsSender.SendDiagnosticInformationFormatted(
                        SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                        "Unhandled message type received: %s",
                        MessageTypeToString(message.type).c_str()
                    );
                } break;
            }
        }

        /**
         * Handle the loss of the connection with the server.
         *
         * @param[in] thisGeneration
         *     This is the generation of the connection which was lost.
         *
         * @param[in] graceful
         *     This indicates whether or not the server closed the
         *     connection gracefully.
         */
        void OnBroken(
            size_t thisGeneration,
            bool graceful
        ) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (generation != thisGeneration) {
                return;
            }
            if (firstReply != nullptr) {
                const auto firstReplySample = firstReply;
                firstReply = nullptr;
                firstReplySample->set_value(Message());
                return;
            }
            diagnosticsSender.SendDiagnosticInformationFormatted(
                (
                    graceful
                    ? 2
                    : SystemAbstractions::DiagnosticsSender::Levels::WARNING
                ),
                "Connection with server %s",
                (graceful ? "closed" : "broken")
            );
            LoseConnection();
        }

        /**
         * Give up on the connection being attempted, if it is still the
         * current one, so that its callbacks are ignored from now on.
         *
         * @param[in] thisGeneration
         *     This is the generation of the connection attempt.
         *
         * @return
         *     The transport of the abandoned connection is returned, for
         *     the caller to close once it no longer holds the lock.  If
         *     the attempt was already superseded, nullptr is returned.
         */
        std::unique_ptr< ITransport > AbandonConnection(size_t thisGeneration) {
            if (generation != thisGeneration) {
                return nullptr;
            }
            firstReply = nullptr;
            ++generation;
            connected = false;
            isCoordinator = false;
            return std::move(transport);
        }

        /**
         * Mark the client disconnected and publish the loss, unless it
         * was already disconnected.  The transport is kept until the
         * next connection attempt, since this may run on its thread.
         */
        void LoseConnection() {
            if (!connected) {
                return;
            }
            ++generation;
            connected = false;
            isCoordinator = false;
            AddToEventQueue(std::make_shared< DisconnectedEvent >());
        }

        /**
         * Send the given message to the server.
         *
         * @param[in] message
         *     This is the message to send.
         *
         * @return
         *     An indication of whether or not the message was sent
         *     is returned.
         */
        bool Send(const Message& message) {
            std::lock_guard< decltype(mutex) > lock(mutex);
            if (
                !connected
                || (transport == nullptr)
            ) {
                return false;
            }
            if (!transport->Send(message)) {
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Failed to send %s message",
                    MessageTypeToString(message.type).c_str()
                );
                return false;
            }
            return true;
        }
    };

    Client::~Client() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        std::unique_ptr< ITransport > transport;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            ++impl_->generation;
            impl_->connected = false;
            transport = std::move(impl_->transport);
        }
        if (transport != nullptr) {
            transport->Close(false);
        }
        if (impl_->eventQueueWorker.joinable()) {
            std::unique_lock< decltype(impl_->eventQueueMutex) > eventQueueLock(impl_->eventQueueMutex);
            impl_->stopEventQueueWorker = true;
            impl_->eventQueueWorkerWakeCondition.notify_one();
            eventQueueLock.unlock();
            impl_->eventQueueWorker.join();
        }
    }
    Client::Client(Client&&) noexcept = default;
    Client& Client::operator=(Client&&) noexcept = default;

    Client::Client()
        : Client(
            [](
                const std::string& address,
                uint16_t port
            ) -> std::unique_ptr< ITransport > {
                return NetworkTransport::Connect(address, port);
            }
        )
    {
    }

    Client::Client(TransportFactory transportFactory)
        : impl_(new Impl())
    {
        impl_->transportFactory = transportFactory;
        impl_->eventQueueWorker = std::thread(&Impl::EventQueueWorker, impl_.get());
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Client::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    auto Client::SubscribeToEvents(EventDelegate eventDelegate) -> EventsUnsubscribeDelegate {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        const auto eventSubscriberId = impl_->nextEventSubscriberId++;
        impl_->eventSubscribers[eventSubscriberId] = eventDelegate;
        const std::weak_ptr< Impl > implWeak = impl_;
        return [implWeak, eventSubscriberId]{
            const auto impl = implWeak.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
            (void)impl->eventSubscribers.erase(eventSubscriberId);
        };
    }

    void Client::SetConnectTimeout(double seconds) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->connectTimeout = seconds;
    }

    auto Client::Connect(
        const std::string& id,
        const std::string& address,
        uint16_t port
    ) -> ConnectResult {
        ConnectResult result;
        std::unique_ptr< ITransport > abandonedTransport;
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->connected) {
            result.error = "Already connected.";
            return result;
        }
        const auto thisGeneration = ++impl_->generation;
        auto oldTransport = std::move(impl_->transport);
        lock.unlock();
        oldTransport = nullptr;
        auto transport = impl_->transportFactory(address, port);
        lock.lock();
        if (impl_->generation != thisGeneration) {
            result.error = "Connection attempt abandoned.";
            return result;
        }
        if (transport == nullptr) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                "Unable to connect to %s:%u",
                address.c_str(),
                (unsigned int)port
            );
            result.error = "Unable to connect to server.";
            return result;
        }
        impl_->id = id;
        impl_->isCoordinator = false;
        impl_->coordinatorId.clear();
        const auto firstReply = std::make_shared< std::promise< Message > >();
        impl_->firstReply = firstReply;
        auto firstReplyFuture = firstReply->get_future();
        impl_->transport = std::move(transport);
        std::weak_ptr< Impl > weakImpl(impl_);
        const auto opened = impl_->transport->Open(
            [weakImpl, thisGeneration](Message&& message){
                const auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                impl->OnMessage(thisGeneration, std::move(message));
            },
            [weakImpl, thisGeneration](bool graceful){
                const auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                impl->OnBroken(thisGeneration, graceful);
            }
        );
        if (
            !opened
            || !impl_->transport->Send(Message(Message::Type::Join, id, ""))
        ) {
            abandonedTransport = impl_->AbandonConnection(thisGeneration);
            result.error = "Unable to communicate with server.";
        } else {
            const auto timeout = std::chrono::milliseconds(
                (long long)(impl_->connectTimeout * 1000.0)
            );
            lock.unlock();
            const auto replied = (
                firstReplyFuture.wait_for(timeout) == std::future_status::ready
            );
            lock.lock();
            if (!replied) {
                abandonedTransport = impl_->AbandonConnection(thisGeneration);
                result.error = "No reply from server.";
            } else {
                const auto reply = firstReplyFuture.get();
                switch (reply.type) {
                    case Message::Type::Join: {
                        if (
                            (impl_->generation != thisGeneration)
                            || !impl_->connected
                        ) {
                            result.error = "Connection with server lost.";
                        } else {
                            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                                2,
                                "Joined as %s (%s)",
                                id.c_str(),
                                reply.GetText().c_str()
                            );
                            result.success = true;
                        }
                    } break;

                    case Message::Type::Error: {
                        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                            "Join refused: %s",
                            reply.GetText().c_str()
                        );
                        abandonedTransport = impl_->AbandonConnection(thisGeneration);
                        result.error = reply.GetText();
                    } break;

                    case Message::Type::Unknown: {
                        abandonedTransport = impl_->AbandonConnection(thisGeneration);
                        result.error = "Connection closed before the server replied.";
                    } break;

                    default: {
                        abandonedTransport = impl_->AbandonConnection(thisGeneration);
                        result.error = "Unexpected reply from server.";
                    } break;
                }
            }
        }
        lock.unlock();

        // The transport's callbacks take the client's lock, so it is
        // closed only after the lock is released.
        if (abandonedTransport != nullptr) {
            abandonedTransport->Close(false);
        }
        return result;
    }

    bool Client::Send(
        const std::string& text,
        const std::string& recipientId
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (
            recipientId.empty()
            || (recipientId == "Broadcast")
        ) {
            return impl_->Send(Message(Message::Type::Broadcast, impl_->id, text));
        }
        Message message(Message::Type::Private, impl_->id, text);
        message.recipientId = recipientId;
        return impl_->Send(message);
    }

    bool Client::SendRaw(const Message& message) {
        return impl_->Send(message);
    }

    void Client::Leave() {
        std::unique_ptr< ITransport > transport;
        {
            std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
            if (!impl_->connected) {
                return;
            }
            (void)impl_->Send(
                Message(Message::Type::Leave, impl_->id, "Leaving the group")
            );
            ++impl_->generation;
            impl_->connected = false;
            impl_->isCoordinator = false;
            transport = std::move(impl_->transport);
        }
        transport->Close(true);
        impl_->diagnosticsSender.SendDiagnosticInformationString(
            2,
            "Left the group"
        );
    }

    bool Client::RespondToHeartbeat() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->Send(Message(Message::Type::Heartbeat, impl_->id, "pong"));
    }

    bool Client::RequestActiveCheck() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->Send(Message(Message::Type::Heartbeat, impl_->id, "manual ping"));
    }

    bool Client::RequestMemberList() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->isCoordinator) {
            return impl_->Send(Message(Message::Type::RequestMemberList, impl_->id, ""));
        } else {
            return impl_->Send(
                Message(
                    Message::Type::RequestMemberListApproval,
                    impl_->id,
                    "Requesting member list approval."
                )
            );
        }
    }

    bool Client::ApproveMemberListRequest(const std::string& requesterId) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        Message approval(Message::Type::MemberListApproved, impl_->id, "");
        approval.recipientId = requesterId;
        return impl_->Send(approval);
    }

    bool Client::DenyMemberListRequest(
        const std::string& requesterId,
        const std::string& reason
    ) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        Message denial(Message::Type::MemberListDenied, impl_->id, reason);
        denial.recipientId = requesterId;
        return impl_->Send(denial);
    }

    bool Client::IsConnected() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->connected;
    }

    bool Client::IsCoordinator() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->isCoordinator;
    }

    std::string Client::GetCoordinatorId() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->coordinatorId;
    }

    std::string Client::GetId() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return impl_->id;
    }

}
